#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <scriptbridge.h>

int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);

    sb_log_set_level(SB_LOG_LVL_WARN);

    int res = context.run();

    if (context.shouldExit())
        return res;

    return res;
}
