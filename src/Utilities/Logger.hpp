//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Named spdlog loggers shared by the node's components.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

void Initialize(spdlog::level::level_enum verbosity = spdlog::level::info, bool useStdOutSink = true);
[[nodiscard]] std::shared_ptr<spdlog::logger> Get(std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
namespace Name {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "core";
constexpr std::string_view Query = "query";
constexpr std::string_view Cluster = "cluster";

constexpr std::array<std::string_view, 3> All = { Core, Query, Cluster };

//----------------------------------------------------------------------------------------------------------------------
} // Name namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Pattern {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Prefix = "==";
constexpr std::string_view TagOpen = "[";
constexpr std::string_view TagClose = "]";
constexpr std::string_view TagSeperator = " ";
constexpr std::string_view Date = "[%a, %d %b %Y %T]";
constexpr std::string_view Message = "%^[%l] - %v%$";

std::string Generate(std::string_view color, std::string_view tag);

//----------------------------------------------------------------------------------------------------------------------
} // Pattern namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Color {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "\x1b[1;38;2;0;255;175m";
constexpr std::string_view Query = "\x1b[1;38;2;0;195;255m";
constexpr std::string_view Cluster = "\x1b[1;38;2;186;120;255m";

constexpr spdlog::string_view_t Info = "\x1b[38;2;26;204;148m";
constexpr spdlog::string_view_t Warn = "\x1b[38;2;255;214;102m";
constexpr spdlog::string_view_t Error = "\x1b[38;2;255;56;56m";
constexpr spdlog::string_view_t Critical = "\x1b[1;38;2;255;56;56m";
constexpr spdlog::string_view_t Debug = "\x1b[38;2;45;204;255m";
constexpr spdlog::string_view_t Trace = "\x1b[38;2;255;255;255m";

constexpr std::string_view Reset = "\x1b[0m";

std::string_view ForLogger(std::string_view name);
std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> CreateTrueColorConsole();

//----------------------------------------------------------------------------------------------------------------------
} // Color namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

inline std::mutex RegistrationMutex;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useStdOutSink)
{
    for (auto const name : Name::All) {
        auto const spLogger = Get(name);
        spLogger->sinks().clear();
        if (useStdOutSink) {
            spLogger->sinks().emplace_back(Color::CreateTrueColorConsole());
            spLogger->set_pattern(Pattern::Generate(Color::ForLogger(name), name));
        }
    }

    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::logger> Logger::Get(std::string_view name)
{
    std::scoped_lock lock{ local::RegistrationMutex };
    if (auto spLogger = spdlog::get(std::string{ name }); spLogger) { return spLogger; }

    // Loggers fetched before initialization have no sinks. Initialize() will attach the console sink later.
    auto spLogger = std::make_shared<spdlog::logger>(std::string{ name });
    spdlog::register_logger(spLogger);
    return spLogger;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Logger::Pattern::Generate(std::string_view color, std::string_view tag)
{
    std::ostringstream oss;
    oss << Prefix << TagSeperator << Date << TagSeperator;
    oss << TagOpen << color << tag << Color::Reset << TagClose << TagSeperator;
    oss << Message;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string_view Logger::Color::ForLogger(std::string_view name)
{
    if (name == Name::Query) { return Query; }
    if (name == Name::Cluster) { return Cluster; }
    return Core;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> Logger::Color::CreateTrueColorConsole()
{
    auto spColorSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    spColorSink->set_color_mode(spdlog::color_mode::always);
    spColorSink->set_color(spdlog::level::info, Color::Info);
    spColorSink->set_color(spdlog::level::warn, Color::Warn);
    spColorSink->set_color(spdlog::level::err, Color::Error);
    spColorSink->set_color(spdlog::level::critical, Color::Critical);
    spColorSink->set_color(spdlog::level::debug, Color::Debug);
    spColorSink->set_color(spdlog::level::trace, Color::Trace);

    return spColorSink;
}

//----------------------------------------------------------------------------------------------------------------------
