#include "gotfiles/cli.hpp"

int main(int argc, char *argv[])
{
    return gotfiles::cli::run(argc, argv);
}
