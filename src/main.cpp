#include "client_id_entry.hpp"

int main(int argc, char *argv[]) { return RunClientIdApplication(argc, argv); }
