#include "steps/config.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace steps {

namespace {

uint64_t ParseUnsigned(std::string_view flag, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(flag) + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(flag) + " value is out of range: " + value);
    }
}

uint32_t ParseDimension(std::string_view flag, const std::string& value) {
    uint64_t v = ParseUnsigned(flag, value);
    if (v == 0 || v > 16384) {
        throw std::invalid_argument(std::string(flag) + " must be between 1 and 16384, got " + value);
    }
    return static_cast<uint32_t>(v);
}

wgpu::PresentMode ParsePresentMode(const std::string& value) {
    if (value == "fifo") return wgpu::PresentMode::Fifo;
    if (value == "fifo-relaxed") return wgpu::PresentMode::FifoRelaxed;
    if (value == "mailbox") return wgpu::PresentMode::Mailbox;
    if (value == "immediate") return wgpu::PresentMode::Immediate;
    throw std::invalid_argument("--present-mode must be one of fifo, fifo-relaxed, mailbox, immediate; got '" + value + "'");
}

} // namespace

AppConfig ParseArgs(int argc, const char* const* argv, AppConfig config) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view flag = argv[i];

        if (flag == "--help" || flag == "-h") {
            config.showHelp = true;
            continue;
        }

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(std::string(flag) + " requires a value");
            return argv[++i];
        };

        if (flag == "--title") {
            config.title = value();
        } else if (flag == "--width") {
            config.width = ParseDimension(flag, value());
        } else if (flag == "--height") {
            config.height = ParseDimension(flag, value());
        } else if (flag == "--min-width") {
            config.minWidth = ParseDimension(flag, value());
        } else if (flag == "--min-height") {
            config.minHeight = ParseDimension(flag, value());
        } else if (flag == "--debounce-ms") {
            const std::string v = value();
            if (!v.empty() && v[0] == '-') {
                throw std::invalid_argument("--debounce-ms must not be negative, got " + v);
            }
            config.resizeDebounce = std::chrono::milliseconds(ParseUnsigned(flag, v));
        } else if (flag == "--texture") {
            config.texturePath = value();
        } else if (flag == "--present-mode") {
            config.presentMode = ParsePresentMode(value());
        } else if (flag == "--log-level") {
            const std::string v = value();
            if (!log::ParseLevel(v, &config.logLevel)) {
                throw std::invalid_argument("--log-level must be one of error, warn, info, debug; got '" + v + "'");
            }
        } else {
            throw std::invalid_argument("Unknown argument: " + std::string(flag));
        }
    }

    if (config.minWidth > config.width || config.minHeight > config.height) {
        std::ostringstream msg;
        msg << "Minimum size " << config.minWidth << "x" << config.minHeight
            << " exceeds window size " << config.width << "x" << config.height;
        throw std::invalid_argument(msg.str());
    }
    return config;
}

AppConfig LoadConfig(int argc, const char* const* argv, AppConfig defaults) {
    log::InitFromEnvironment();
    defaults.logLevel = log::GetLevel();
    AppConfig config = ParseArgs(argc, argv, std::move(defaults));
    log::SetLevel(config.logLevel);
    return config;
}

std::string Usage(const char* program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --title <text>          window title\n"
        << "  --width <px>            initial width (default 800)\n"
        << "  --height <px>           initial height (default 600)\n"
        << "  --min-width <px>        minimum width (default 400)\n"
        << "  --min-height <px>       minimum height (default 300)\n"
        << "  --debounce-ms <ms>      resize debounce delay (default 100)\n"
        << "  --texture <file.png>    diffuse texture (default: generated stone)\n"
        << "  --present-mode <mode>   fifo | fifo-relaxed | mailbox | immediate\n"
        << "  --log-level <level>     error | warn | info | debug (or STEPS_LOG)\n"
        << "  --help                  show this text\n";
    return out.str();
}

} // namespace steps
