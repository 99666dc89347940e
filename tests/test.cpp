#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"

#include "concurrent/parallel.h"

int main(int argc, char** argv) {
    // a few workers, so passes really run concurrently.
    Parallel::init(3);

    doctest::Context context;
    context.applyCommandLine(argc, argv);

    int res = context.run(); // run

    Parallel::shutdown();

    return res;
}
