#include "naming.policy.hh"
#include "unit.test.macros.hh"

#include <chrono>

namespace {
// 2021-03-04T05:06:07Z
std::chrono::system_clock::time_point
fixed_time()
{
    return std::chrono::system_clock::time_point{ std::chrono::seconds{
      1614834367 } };
}
} // namespace

int
main()
{
    int retval = 0;

    try {
        // folders end in exactly one slash
        EXPECT_STR_EQ(logship::normalize_folder(""), "");
        EXPECT_STR_EQ(logship::normalize_folder("logs"), "logs/");
        EXPECT_STR_EQ(logship::normalize_folder("logs/"), "logs/");
        EXPECT_STR_EQ(logship::normalize_folder("logs///"), "logs/");
        EXPECT_STR_EQ(logship::normalize_folder("a/b"), "a/b/");
        EXPECT_STR_EQ(logship::normalize_folder("/"), "/");

        const auto format = logship::default_name_format(
          "production", "web-1", false, true);
        EXPECT_STR_EQ(format, "%Y-%b-%d-%H-%M-production-web-1.log.gz");
        EXPECT_STR_EQ(
          logship::default_name_format("staging", "db", true, false),
          "%Y-%b-%d-%H-%M-staging-db.json");

        EXPECT_STR_EQ(logship::make_object_key("logs", fixed_time(), format),
                      "logs/2021-Mar-04-05-06-production-web-1.log.gz");
        EXPECT_STR_EQ(logship::make_object_key("", fixed_time(), format),
                      "2021-Mar-04-05-06-production-web-1.log.gz");

        // literal percent signs in the environment survive rendering
        EXPECT_STR_EQ(
          logship::make_object_key(
            "x/",
            fixed_time(),
            logship::default_name_format("100%", "h", false, false)),
          "x/2021-Mar-04-05-06-100%-h.log");

        EXPECT_STR_EQ(
          logship::make_object_key("a", fixed_time(), "%Y%m%d%H%M%S"),
          "a/20210304050607");

        // an empty format is rejected
        bool threw = false;
        try {
            (void)logship::make_object_key("a", fixed_time(), "");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        CHECK(threw);

        CHECK(!logship::default_environment().empty());
        CHECK(!logship::host_name().empty());
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
