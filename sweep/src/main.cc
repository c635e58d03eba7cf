#include "bloomstock/cleanup_sweeper.hpp"
#include "bloomstock/config.hpp"
#include "bloomstock/database.hpp"
#include "bloomstock/errors.hpp"
#include "bloomstock/logging.hpp"
#include "bloomstock/schema.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

struct Options {
    bool execute = false;
    bool stats_only = false;
    bool help = false;
    int hours = -1;
};

void print_usage(std::ostream& out) {
    out << "Usage: bloomstock-sweep [--execute] [--hours N] [--stats-only] [--help]\n"
        << "\n"
        << "Releases reservations held by orders that are older than N hours and\n"
        << "still new or cancelled. Runs as a dry run unless --execute is given.\n"
        << "\n"
        << "  --execute     delete the expired reservations\n"
        << "  --hours N     age threshold in hours (default BLOOMSTOCK_CLEANUP_MAX_AGE_HOURS or 72)\n"
        << "  --stats-only  print reservation statistics and exit\n"
        << "  --help        show this message\n";
}

Options parse_args(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--execute") {
            options.execute = true;
        } else if (arg == "--stats-only") {
            options.stats_only = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--hours") {
            if (i + 1 >= argc) throw bloomstock::InvalidArgumentError("--hours requires a value");
            std::string value = argv[++i];
            size_t consumed = 0;
            try {
                options.hours = std::stoi(value, &consumed);
            } catch (const std::logic_error&) {
                throw bloomstock::InvalidArgumentError("Invalid --hours value: " + value);
            }
            if (consumed != value.size() || options.hours < 0) {
                throw bloomstock::InvalidArgumentError("Invalid --hours value: " + value);
            }
        } else {
            throw bloomstock::InvalidArgumentError("Unknown argument: " + arg);
        }
    }
    return options;
}

void print_statistics(const bloomstock::ReservationStatistics& stats) {
    std::cout << "Active reservations: " << stats.total << "\n";
    for (const auto& [status, count] : stats.by_order_status) {
        std::cout << "  order status " << status << ": " << count << "\n";
    }
    std::cout << "By age:\n"
              << "  under 1 hour:   " << stats.under_one_hour << "\n"
              << "  1 to 24 hours:  " << stats.one_to_24_hours << "\n"
              << "  1 to 7 days:    " << stats.one_to_7_days << "\n"
              << "  over 7 days:    " << stats.over_7_days << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    using namespace bloomstock;

    Options options;
    try {
        options = parse_args(argc, argv);
    } catch (const InvalidArgumentError& e) {
        std::cerr << e.what() << "\n";
        print_usage(std::cerr);
        return 2;
    }

    if (options.help) {
        print_usage(std::cout);
        return 0;
    }

    try {
        Config config = Config::from_env();
        set_log_level(config.log_level);

        Database db(config.db_path, config.busy_timeout_ms);
        apply_schema(db);
        CleanupSweeper sweeper(db);

        if (options.stats_only) {
            print_statistics(sweeper.statistics());
            return 0;
        }

        int hours = options.hours >= 0 ? options.hours : config.cleanup_max_age_hours;
        auto stats = sweeper.sweep(hours, !options.execute);

        std::cout << (options.execute ? "Cleanup" : "Dry run") << " (older than " << hours << "h):\n"
                  << "  orders found:          " << stats.orders_found << "\n"
                  << "  reservations found:    " << stats.reservations_found << "\n"
                  << "  reservations deleted:  " << stats.reservations_deleted << "\n";
        if (!options.execute && stats.reservations_found > 0) {
            std::cout << "Run with --execute to delete them.\n";
        }
        return 0;
    } catch (const InventoryError& e) {
        log_error("sweep", "cleanup_failed", {{"error", e.what()}});
        return 1;
    }
}
