#include "lumen/client/client.hpp"
#include "lumen/client/config.hpp"
#include "lumen/error.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

constexpr int kDefaultSeconds = 3;

void print_usage(const char *argv0) {
    std::fprintf(stderr, "usage: %s [config.json] [--seconds N]\n", argv0);
}

bool parse_seconds(std::string_view text, int &seconds) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
    return ec == std::errc{} && ptr == text.data() + text.size() && seconds > 0;
}

} // namespace

int main(int argc, char *argv[]) {
    std::string config_path;
    int seconds = kDefaultSeconds;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--seconds") {
            if (i + 1 >= argc || !parse_seconds(argv[i + 1], seconds)) {
                print_usage(argv[0]);
                return 2;
            }
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (config_path.empty() && !arg.starts_with("-")) {
            config_path = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        lumen::client::ClientConfig config;
        if (!config_path.empty()) {
            config = lumen::client::load_client_config(config_path);
        }

        lumen::client::Client client(config);
        client.listen();
        client.discover();

        std::this_thread::sleep_for(std::chrono::seconds(seconds));
        client.close();

        auto devices = client.devices();
        std::vector<lumen::data::Bulb> bulbs;
        bulbs.reserve(devices.size());
        for (auto &[target, bulb] : devices) {
            bulbs.push_back(std::move(bulb));
        }
        std::sort(bulbs.begin(), bulbs.end(),
                  [](const auto &lhs, const auto &rhs) { return lhs.target < rhs.target; });

        const nlohmann::json out = bulbs;
        std::printf("%s\n", out.dump(2).c_str());
        std::fprintf(stderr, "[Lumen] %zu device(s) found in %ds\n", bulbs.size(), seconds);
    } catch (const lumen::Error &e) {
        std::fprintf(stderr, "[Lumen] %s\n", e.what());
        return 1;
    }
    return 0;
}
