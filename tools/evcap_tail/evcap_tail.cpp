#include "app/TailArgs.h"
#include "core/Config.h"

#include "evcap/EventBuffer.hpp"
#include "evcap/Log.hpp"
#include "evcap/SignalSource.hpp"
#include "evcap/Status.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using evcap::EventBuffer;
using evcap::SignalSource;

using LineBuffer = EventBuffer<std::string>;

static std::string ToUpper(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

// Blank lines are rejected so they show up as transform errors instead of empty entries.
static std::string TrimOrReject(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        throw std::invalid_argument("blank line");
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static bool MakeTransform(const std::string& name, LineBuffer::Options& opt) {
    if (name.empty() || name == "none")
        return true;
    if (name == "upper") {
        opt.transform = ToUpper;
        opt.transformName = "upper";
        return true;
    }
    if (name == "trim") {
        opt.transform = TrimOrReject;
        opt.transformName = "trim";
        return true;
    }
    return false;
}

static void PrintStatus(const LineBuffer& buf, bool json) {
    const auto st = buf.status();
    if (json)
        std::cout << evcap::StatusToJson(st).dump(2) << "\n";
    else
        std::cout << evcap::FormatStatus(st);
}

static void PrintAll(const LineBuffer& buf) {
    for (const auto& line : buf.all())
        std::cout << line << "\n";
}

// Returns false for lines that are not control lines.
static bool HandleControl(LineBuffer& buf, std::string_view line, bool json) {
    if (line.empty() || line.front() != '!')
        return false;

    if (line == "!stop")        buf.stop();
    else if (line == "!start")  buf.start();
    else if (line == "!clear")  buf.clear();
    else if (line == "!all")    PrintAll(buf);
    else if (line == "!status") PrintStatus(buf, json);
    else if (line == "!last" || line == "!pop") {
        const auto v = (line == "!pop") ? buf.pop() : buf.last();
        std::cout << (v ? *v : std::string("<empty>")) << "\n";
    }
    else
        return false;

    return true;
}

int main(int argc, char** argv) {
    std::vector<std::string_view> rawArgs;
    for (int i = 1; i < argc; ++i)
        rawArgs.emplace_back(argv[i]);

    const evcap::app::TailArgs args = evcap::app::ParseTailArgs(rawArgs);
    if (args.showHelp) {
        std::cout << evcap::app::BuildTailHelpText();
        return 0;
    }
    if (!args.unknown.empty()) {
        for (const auto& u : args.unknown)
            std::cerr << "evcap_tail: unknown or malformed option: " << u << "\n";
        std::cerr << "Try --help.\n";
        return 2;
    }

    evcap::core::CaptureConfig cfg;
    cfg.channel = "line";
    if (args.configDir && !evcap::core::LoadCaptureConfig(cfg, *args.configDir))
        std::cerr << "evcap_tail: no capture.ini in " << *args.configDir << ", using defaults\n";

    if (args.channel)  cfg.channel  = *args.channel;
    if (args.capacity) cfg.capacity = *args.capacity;
    if (args.logLevel) cfg.logLevel = *args.logLevel;

    evcap::logsys::LogOptions logOpt;
    logOpt.level = evcap::logsys::parseLevel(cfg.logLevel);
    logOpt.file  = cfg.logFile;
    evcap::logsys::init(logOpt);
    auto log = evcap::logsys::get();

    if (const std::string problem = evcap::core::ValidateCaptureConfig(cfg); !problem.empty()) {
        log->error("invalid configuration: {}", problem);
        return 2;
    }

    LineBuffer::Options opt;
    opt.capacity = cfg.capacity;
    if (!MakeTransform(args.transform.value_or("none"), opt)) {
        log->error("unknown transform '{}'", *args.transform);
        return 2;
    }

    SignalSource<std::string> stdinSource("stdin");
    stdinSource.declareChannel(cfg.channel);

    int rc = 0;
    try {
        LineBuffer buffer(stdinSource, cfg.channel, opt);

        std::string line;
        while (std::getline(std::cin, line)) {
            if (HandleControl(buffer, line, args.json))
                continue;
            stdinSource.publish(cfg.channel, line);
        }

        PrintAll(buffer);
        buffer.close();
        PrintStatus(buffer, args.json);
    } catch (const evcap::CaptureError& e) {
        log->error("{}", e.what());
        rc = 1;
    }

    evcap::logsys::shutdown();
    return rc;
}
