#include <cinder/cli/cli.h>

int main(int argc, char** argv)
{
    return cinder::cli::run(argc, argv);
}
