#pragma once

#include <boost/program_options.hpp>
#include <iostream>
#include <optional>
#include <string>

struct CmdOptions {
    std::string scenario; // required, JSON file
    std::string venue; // required
    std::string date; // required, YYYY-MM-DD
    std::optional<std::string> now; // "HH:MM" on --date or ISO; pins the clock
    std::optional<std::string> tz; // IANA zone override
    std::optional<std::string> start; // enables durations + court statuses
    std::optional<std::string> court; // court mode for durations
    std::optional<int> duration; // minutes for court statuses
    std::optional<int> grace; // overrides config graceMinutes
    std::string user;
    bool verbose{false};

    bool show_help{false};
};

inline bool parse_cmdline(int argc, char **argv, CmdOptions &out) {
    namespace po = boost::program_options;

    po::options_description desc("Options");
    desc.add_options()
            ("help,h", "Show this help message")
            ("scenario,s", po::value<std::string>()->required(),
             "Scenario JSON with venues, courts and bookings")
            ("venue,v", po::value<std::string>()->required(),
             "Venue id")
            ("date,d", po::value<std::string>()->required(),
             "Selected date, YYYY-MM-DD")
            ("now", po::value<std::string>(),
             "Pin the local clock: HH:MM on --date, or an ISO timestamp")
            ("tz", po::value<std::string>(),
             "IANA timezone, e.g. Europe/Berlin (default: scenario, TZ, /etc/timezone)")
            ("start", po::value<std::string>(),
             "Start time (HH:MM or ISO) for durations and court statuses")
            ("court,c", po::value<std::string>(),
             "Court id; durations are computed for this court only")
            ("duration", po::value<int>(),
             "Duration in minutes for court statuses")
            ("grace", po::value<int>(),
             "Grace minutes before a started slot counts as past")
            ("user,u", po::value<std::string>()->default_value(""),
             "User id passed to pricing")
            ("verbose", po::bool_switch()->default_value(false),
             "Print info log lines");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Usage: " << argv[0]
                    << " --scenario FILE --venue ID --date YYYY-MM-DD "
                    "[--now HH:MM] [--tz ZONE] [--start HH:MM] [--court ID] "
                    "[--duration MIN] [--user ID] [--verbose]\n\n";
            std::cout << desc << "\n";
            out.show_help = true;
            return true;
        }

        // Enforce required options
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "Error parsing command line: " << e.what() << "\n\n";
        std::cerr << desc << "\n";
        return false;
    }

    out.scenario = vm["scenario"].as<std::string>();
    out.venue = vm["venue"].as<std::string>();
    out.date = vm["date"].as<std::string>();
    out.user = vm["user"].as<std::string>();
    out.verbose = vm["verbose"].as<bool>();
    if (vm.contains("now")) out.now = vm["now"].as<std::string>();
    if (vm.contains("tz")) out.tz = vm["tz"].as<std::string>();
    if (vm.contains("start")) out.start = vm["start"].as<std::string>();
    if (vm.contains("court")) out.court = vm["court"].as<std::string>();
    if (vm.contains("duration")) out.duration = vm["duration"].as<int>();
    if (vm.contains("grace")) out.grace = vm["grace"].as<int>();

    return true;
}
