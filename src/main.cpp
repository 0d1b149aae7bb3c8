#include "hotword/cli/commands.hpp"

int main(int argc, char **argv) { return hotword::cli::run_cli(argc, argv); }
