#include <catch2/catch_test_macros.hpp>

#include <cfs_bridge/core/terminal.hpp>

#include <cstdlib>
#include <optional>
#include <string>

using namespace cfs_bridge;

namespace {

// Sets or clears NO_COLOR for one test and restores the previous value.
class ScopedNoColor {
public:
    explicit ScopedNoColor(const char* value) {
        if (const char* old = std::getenv("NO_COLOR")) {
            saved_ = std::string(old);
        }
        if (value != nullptr) {
            ::setenv("NO_COLOR", value, 1);
        } else {
            ::unsetenv("NO_COLOR");
        }
    }
    ~ScopedNoColor() {
        if (saved_) {
            ::setenv("NO_COLOR", saved_->c_str(), 1);
        } else {
            ::unsetenv("NO_COLOR");
        }
    }

private:
    std::optional<std::string> saved_;
};

} // anonymous namespace

TEST_CASE("NoColorEnvSet: follows the NO_COLOR variable", "[core][terminal]") {
    {
        ScopedNoColor unset(nullptr);
        CHECK_FALSE(NoColorEnvSet());
    }
    {
        ScopedNoColor set("1");
        CHECK(NoColorEnvSet());
    }
    {
        ScopedNoColor empty("");
        CHECK_FALSE(NoColorEnvSet());
    }
}

TEST_CASE("ResolveLogColor: explicit choice wins", "[core][terminal]") {
    CHECK(ResolveLogColor(true, false, true));
    CHECK_FALSE(ResolveLogColor(false, true, false));
}

TEST_CASE("ResolveLogColor: auto needs a terminal and no NO_COLOR", "[core][terminal]") {
    CHECK(ResolveLogColor(std::nullopt, true, false));
    CHECK_FALSE(ResolveLogColor(std::nullopt, false, false));
    CHECK_FALSE(ResolveLogColor(std::nullopt, true, true));
}
