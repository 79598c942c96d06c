#include <gtest/gtest.h>

#include "securexfer/AppPaths.h"
#include "securexfer/config.h"

#include <cstdlib>
#include <filesystem>
#include <string>

using namespace SecureXfer;

namespace {

/**
 * @brief Sets an environment variable for one test and restores it afterwards
 */
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : m_name(name) {
        const char* old = std::getenv(name);
        m_hadValue = (old != nullptr);
        if (m_hadValue) {
            m_oldValue = old;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (m_hadValue) {
            ::setenv(m_name.c_str(), m_oldValue.c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
    }

private:
    std::string m_name;
    std::string m_oldValue;
    bool m_hadValue = false;
};

}  // namespace

TEST(AppPathsTest, XdgVariablesTakePrecedence)
{
    ScopedEnv home("HOME", "/home/tester");
    ScopedEnv data("XDG_DATA_HOME", "/xdg/data");
    ScopedEnv config("XDG_CONFIG_HOME", "/xdg/config");

    EXPECT_EQ(AppPaths::dataRoot(), std::filesystem::path("/xdg/data/securexfer"));
    EXPECT_EQ(AppPaths::configJsonPath(),
              std::filesystem::path("/xdg/config/securexfer") / CONFIG_FILE_NAME);
    EXPECT_EQ(AppPaths::defaultLogPath(),
              std::filesystem::path("/xdg/data/securexfer") / LOG_FILE_NAME);
}

TEST(AppPathsTest, FallsBackToHomeDirectories)
{
    ScopedEnv home("HOME", "/home/tester");
    ScopedEnv data("XDG_DATA_HOME", nullptr);
    ScopedEnv config("XDG_CONFIG_HOME", nullptr);

    EXPECT_EQ(AppPaths::dataRoot(), std::filesystem::path("/home/tester/.local/share/securexfer"));
    EXPECT_EQ(AppPaths::configDir(), std::filesystem::path("/home/tester/.config/securexfer"));
    EXPECT_EQ(AppPaths::defaultDownloadDir(), std::filesystem::path("/home/tester/Downloads"));
}

TEST(AppPathsTest, RelativeEnvironmentValuesAreIgnored)
{
    ScopedEnv home("HOME", "/home/tester");
    ScopedEnv data("XDG_DATA_HOME", "relative/data");

    EXPECT_EQ(AppPaths::dataRoot(), std::filesystem::path("/home/tester/.local/share/securexfer"));
}

TEST(AppPathsTest, NoHomeMeansNoPaths)
{
    ScopedEnv home("HOME", nullptr);
    ScopedEnv data("XDG_DATA_HOME", nullptr);
    ScopedEnv config("XDG_CONFIG_HOME", nullptr);

    EXPECT_TRUE(AppPaths::configJsonPath().empty());
    EXPECT_TRUE(AppPaths::defaultDownloadDir().empty());
}
