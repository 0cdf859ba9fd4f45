#include <examkit/cli/cli.h>

int main(int argc, char** argv)
{
    return examkit::cli::run(argc, argv);
}
