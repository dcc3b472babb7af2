#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return hzip::cli::run(argc, argv);
}
