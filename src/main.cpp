#include <iostream>
#include <iomanip>
#include <sstream>
#include <optional>
#include <vector>
#include <cstring>
#include <ctime>
#include <curl/curl.h>

#include "app_config.hpp"
#include "errors.hpp"
#include "extremum_finder.hpp"
#include "price_source_factory.hpp"
#include "window_search.hpp"

namespace {

struct CommandLine {
    std::string config_path;
    std::string snapshot_path;
    std::optional<int> hour;
    std::vector<double> durations;
    bool help = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <path>      JSON configuration file\n"
              << "  --snapshot <path>    read prices from a JSON snapshot instead of the API\n"
              << "  --hour <0-23>        reference hour (default: current local hour)\n"
              << "  --duration <hours>   window length, may be fractional; repeatable\n"
              << "  --help               show this message\n";
}

// Returns false on a malformed argument
bool parseArguments(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        const bool has_value = i + 1 < argc;

        if (std::strcmp(argv[i], "--help") == 0) {
            cmd.help = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && has_value) {
            cmd.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--snapshot") == 0 && has_value) {
            cmd.snapshot_path = argv[++i];
        } else if (std::strcmp(argv[i], "--hour") == 0 && has_value) {
            auto hour = parseHourArgument(argv[++i]);
            if (!hour) {
                std::cerr << "Error: Hour must be a whole number between 0 and 23, got '"
                          << argv[i] << "'\n";
                return false;
            }
            cmd.hour = hour;
        } else if (std::strcmp(argv[i], "--duration") == 0 && has_value) {
            auto duration = parseDurationArgument(argv[++i]);
            if (!duration) {
                std::cerr << "Error: Duration must be a positive number of hours, got '"
                          << argv[i] << "'\n";
                return false;
            }
            cmd.durations.push_back(*duration);
        } else {
            std::cerr << "Error: Unknown or incomplete argument '" << argv[i] << "'\n";
            return false;
        }
    }
    return true;
}

int currentLocalHour() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return local.tm_hour;
}

std::string formatPrice(std::optional<Price> price) {
    if (!price) return "n/a";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << *price;
    return ss.str();
}

std::string formatQuote(const HourQuote& quote) {
    if (!quote.found) return "n/a";
    std::ostringstream ss;
    ss << formatPrice(quote.price) << " at " << std::setw(2) << std::setfill('0')
       << quote.hour << ":00";
    return ss.str();
}

std::string formatWindow(const WindowResult& window) {
    if (!window.found) return "n/a";
    std::ostringstream ss;
    ss << formatPrice(window.average_price) << " avg from " << std::setw(2)
       << std::setfill('0') << window.start_hour << ":00 " << dayName(window.start_day);
    return ss.str();
}

void printReport(const PriceSeries& series, int hour, const std::vector<double>& durations) {
    std::cout << "Prices available: " << series.size() << "/" << SLOT_COUNT << "\n";
    std::cout << "Current price (" << std::setw(2) << std::setfill('0') << hour
              << ":00): " << formatPrice(ExtremumFinder::currentPrice(series, hour)) << "\n";
    std::cout << "Highest today:      " << formatQuote(ExtremumFinder::highestToday(series)) << "\n";
    std::cout << "Lowest day (06-18): "
              << formatQuote(ExtremumFinder::lowestInPeriod(series, Period::DAY)) << "\n";
    std::cout << "Lowest night (18-06): "
              << formatQuote(ExtremumFinder::lowestInPeriod(series, Period::NIGHT)) << "\n";

    for (double duration : durations) {
        std::cout << "\nCheapest " << duration << "h window from " << std::setw(2)
                  << std::setfill('0') << hour << ":00\n";
        std::cout << "  Day:   "
                  << formatWindow(WindowSearch::cheapestDayWindow(series, duration, hour)) << "\n";
        std::cout << "  Night: "
                  << formatWindow(WindowSearch::cheapestNightWindow(series, duration, hour)) << "\n";
        std::cout << "  Full:  "
                  << formatWindow(WindowSearch::cheapestFullWindow(series, duration, hour)) << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseArguments(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 1;
    }
    if (cmd.help) {
        printUsage(argv[0]);
        return 0;
    }

    AppConfig config = AppConfig::load(cmd.config_path);
    if (!cmd.snapshot_path.empty()) {
        config.source.type = SourceType::FILE;
        config.source.snapshot_path = cmd.snapshot_path;
    }
    if (!cmd.durations.empty()) {
        config.durations = cmd.durations;
    }

    const int hour = cmd.hour ? *cmd.hour : currentLocalHour();

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exit_code = 0;
    try {
        auto source = PriceSourceFactory::createFromConfig(config.source);

        PriceSeries series;
        {
            ScopedSession session(*source);
            series = source->fetchSnapshot();
        }

        if (series.empty()) {
            std::cerr << "Warning: " << source->getName() << " returned no prices\n";
        }

        printReport(series, hour, config.durations);

    } catch (const PriceFetchError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
