#include "tasktide/cli/commands.hpp"

int main(int argc, char **argv) { return tasktide::cli::run_cli(argc, argv); }
