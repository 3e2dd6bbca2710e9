#include "sessionflow/cli/commands.hpp"

int main(int argc, char **argv) { return sessionflow::cli::run_cli(argc, argv); }
