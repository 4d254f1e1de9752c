#include "Clock.h"
#include "LimbEnv.h"
#include "Log.h"
#include "SimulatedLimb.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

bool parseActions(const std::string& text, std::vector<double>& out) {
    out.clear();
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const std::string v = toLower(item);
        if (v == "c" || v == "contract") {
            out.push_back(pneuma::kActionContract);
        } else if (v == "h" || v == "hold") {
            out.push_back(pneuma::kActionHold);
        } else if (v == "l" || v == "loose") {
            out.push_back(pneuma::kActionLoose);
        } else {
            try {
                out.push_back(std::stod(item));
            } catch (const std::exception&) {
                return false;
            }
        }
    }
    return !out.empty();
}

void printUsage() {
    std::cout << "LimbTool usage:\n"
              << "  LimbTool [--muscles n] [--hostname name] --actions a,b,c [--actions ...]\n"
              << "           [--period s] [--timeout s] [--out file] [--log-level debug|info|warning|error]\n"
              << "\n"
              << "  Each --actions vector (values, or c/h/l for contract/hold/loose) is held for\n"
              << "  --period seconds on a simulated limb; observations are sampled every step\n"
              << "  and written as CSV. The limb is loosened and closed at the end.\n";
}
} // namespace

int main(int argc, char** argv) {
    int muscles = 3;
    std::string hostname = "clonepiext";
    std::vector<std::vector<double>> sequence;
    double period = 0.25;
    double timeout = pneuma::kCycleTimeout_s;
    std::string out = "limb_trace.csv";
    pneuma::LogLevel level = pneuma::LogLevel::Warning;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--muscles" && i + 1 < argc) {
            muscles = std::stoi(argv[++i]);
        } else if (arg == "--hostname" && i + 1 < argc) {
            hostname = argv[++i];
        } else if (arg == "--actions" && i + 1 < argc) {
            std::vector<double> a;
            if (!parseActions(argv[++i], a)) {
                std::cout << "Bad action vector: " << argv[i] << "\n";
                printUsage();
                return 1;
            }
            sequence.push_back(a);
        } else if (arg == "--period" && i + 1 < argc) {
            period = std::stod(argv[++i]);
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout = std::stod(argv[++i]);
        } else if (arg == "--out" && i + 1 < argc) {
            out = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            if (!pneuma::parseLogLevel(argv[++i], level)) {
                std::cout << "Unknown log level: " << argv[i] << "\n";
                printUsage();
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (sequence.empty()) {
        printUsage();
        return 1;
    }
    if (muscles < 1 || muscles > pneuma::kMaxMuscles) {
        std::cout << "--muscles must be in 1.." << pneuma::kMaxMuscles << "\n";
        return 1;
    }
    for (const auto& a : sequence) {
        if (static_cast<int>(a.size()) != muscles) {
            std::cout << "Action vector has " << a.size() << " entries, limb has " << muscles << " muscles\n";
            return 1;
        }
    }

    std::ofstream csv(out);
    if (!csv.is_open()) {
        std::cout << "Cannot open output file: " << out << "\n";
        return 1;
    }

    pneuma::SimulatedLimb::Config sim_cfg;
    sim_cfg.muscles = muscles;
    pneuma::SimulatedLimb limb(sim_cfg);

    pneuma::LimbConfig cfg;
    cfg.hostname = hostname;
    cfg.cycle_timeout_s = timeout;
    cfg.log_level = level;
    pneuma::setLogRole("env");

    pneuma::LimbEnv env(cfg, limb.factory());

    csv << "t_s,segment";
    for (int m = 0; m < muscles; ++m) csv << ",action_" << m;
    for (int m = 0; m < muscles; ++m) csv << ",contraction_" << m;
    csv << '\n';
    csv << std::fixed << std::setprecision(6);

    std::size_t rows = 0;
    try {
        env.connect();
        const double t0 = pneuma::monotonicNow_s();
        for (std::size_t seg = 0; seg < sequence.size(); ++seg) {
            const std::vector<double>& a = sequence[seg];
            const double seg_start = pneuma::monotonicNow_s();
            do {
                env.step(a);
                const std::vector<double> obs = env.getObs();
                csv << (pneuma::monotonicNow_s() - t0) << ',' << seg;
                for (double v : a) csv << ',' << v;
                for (double v : obs) csv << ',' << v;
                csv << '\n';
                ++rows;
            } while (pneuma::monotonicNow_s() - seg_start < period);
        }
        env.close();
    } catch (const pneuma::WorkerFaultError& e) {
        std::cout << "Worker fault after " << rows << " samples:\n" << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Wrote " << rows << " samples to: " << out << "\n";
    return 0;
}
