#include "naming.policy.hh"
#include "macros.hh"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace {
// '%' in literal text must survive strftime
std::string
escape_format(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text) {
        if (c == '%') {
            escaped += '%';
        }
        escaped += c;
    }

    return escaped;
}
} // namespace

std::string
logship::normalize_folder(std::string_view folder)
{
    if (folder.empty()) {
        return {};
    }

    const auto last = folder.find_last_not_of('/');
    if (last == std::string_view::npos) {
        return "/";
    }

    return std::string(folder.substr(0, last + 1)) + "/";
}

std::string
logship::make_object_key(std::string_view folder,
                         std::chrono::system_clock::time_point created_at,
                         std::string_view name_format)
{
    EXPECT(!name_format.empty(), "Name format must not be empty.");

    const auto time = std::chrono::system_clock::to_time_t(created_at);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif

    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm, std::string(name_format).c_str());

    const std::string name = ss.str();
    EXPECT(!name.empty(), "Name format '", name_format, "' renders empty.");

    return normalize_folder(folder) + name;
}

std::string
logship::default_name_format(std::string_view environment,
                             std::string_view hostname,
                             bool save_logs_in_json,
                             bool compress)
{
    std::string format = "%Y-%b-%d-%H-%M-";
    format += escape_format(environment);
    format += "-";
    format += escape_format(hostname);
    format += save_logs_in_json ? ".json" : ".log";
    if (compress) {
        format += ".gz";
    }

    return format;
}

std::string
logship::default_environment()
{
    if (const char* env = std::getenv("LOGSHIP_ENVIRONMENT");
        env != nullptr && *env != '\0') {
        return env;
    }

    return "development";
}

std::string
logship::host_name()
{
#if defined(_WIN32)
    if (const char* name = std::getenv("COMPUTERNAME");
        name != nullptr && *name != '\0') {
        return name;
    }
#else
    char buffer[256] = { 0 };
    if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
        return buffer;
    }
#endif

    LOG_WARNING("Failed to get host name. Using 'localhost'.");
    return "localhost";
}
