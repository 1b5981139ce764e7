/**
 * @file main.cpp
 * @brief Точка входа csvnorm: нормализация CSV из stdin в stdout
 */

#include "report_runner.hpp"
#include "core/stream_sanitizer.hpp"
#include "core/time_zone.hpp"
#include "io/settings_io.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

using csvnorm::model::SanitizerSettings;

constexpr int kExitOk = 0;
constexpr int kExitRuntime = 1;
constexpr int kExitUsage = 2;

/**
 * @brief Ошибка командной строки
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

void printUsage(std::ostream& os) {
    os << "Использование: csvnorm [опции] < input.csv > output.csv\n"
       << "\n"
       << "Опции:\n"
       << "  --config <file.json>     настройки в формате JSON\n"
       << "  --tz <zone>              часовой пояс входных меток времени\n"
       << "                           (по умолчанию America/Los_Angeles)\n"
       << "  --output-tz <zone>       часовой пояс вывода\n"
       << "  --ambiguous <standard|daylight>\n"
       << "                           разрешение повторяющегося часа\n"
       << "  --header <pass|drop|none>\n"
       << "                           обработка строки заголовка\n"
       << "  --pad-zip                дополнять цифровой ZIP нулями до 5 знаков\n"
       << "  --recompute-total        TotalDuration = FooDuration + BarDuration\n"
       << "  --precision <N>          число знаков после точки в длительностях\n"
       << "  --report <dir>           записать report.json и report.md в каталог\n"
       << "  --quiet                  без диагностики в stderr\n"
       << "  --list-zones             вывести известные часовые пояса\n"
       << "  --help                   эта справка\n"
       << "  --version                версия\n";
}

struct CommandLine {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> input_zone;
    std::optional<std::string> output_zone;
    std::optional<std::string> ambiguous;
    std::optional<std::string> header;
    std::optional<int> precision;
    std::optional<std::filesystem::path> report_dir;
    bool pad_zip = false;
    bool recompute_total = false;
    bool quiet = false;
    bool list_zones = false;
    bool help = false;
    bool version = false;
};

int parsePrecision(const std::string& value) {
    size_t consumed = 0;
    int precision = 0;
    try {
        precision = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError("Неверное значение --precision: " + value);
    }
    if (consumed != value.size() || precision < 0 || precision > 9) {
        throw UsageError("Значение --precision должно быть целым от 0 до 9: " + value);
    }
    return precision;
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine cl;

    auto requireValue = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError("Для " + std::string(flag) + " не указано значение");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--config") {
            cl.config_path = std::filesystem::path(requireValue(i, arg));
        } else if (arg == "--tz") {
            cl.input_zone = requireValue(i, arg);
        } else if (arg == "--output-tz") {
            cl.output_zone = requireValue(i, arg);
        } else if (arg == "--ambiguous") {
            cl.ambiguous = requireValue(i, arg);
        } else if (arg == "--header") {
            cl.header = requireValue(i, arg);
        } else if (arg == "--precision") {
            cl.precision = parsePrecision(requireValue(i, arg));
        } else if (arg == "--report") {
            cl.report_dir = std::filesystem::path(requireValue(i, arg));
        } else if (arg == "--pad-zip") {
            cl.pad_zip = true;
        } else if (arg == "--recompute-total") {
            cl.recompute_total = true;
        } else if (arg == "--quiet") {
            cl.quiet = true;
        } else if (arg == "--list-zones") {
            cl.list_zones = true;
        } else if (arg == "--help" || arg == "-h") {
            cl.help = true;
        } else if (arg == "--version") {
            cl.version = true;
        } else {
            throw UsageError("Неизвестный аргумент: " + std::string(arg));
        }
    }

    return cl;
}

// Файл настроек, затем флаги командной строки поверх него
SanitizerSettings buildSettings(const CommandLine& cl) {
    SanitizerSettings settings;
    if (cl.config_path) {
        settings = csvnorm::io::loadSettings(*cl.config_path);
    }

    if (cl.input_zone) settings.input_time_zone = *cl.input_zone;
    if (cl.output_zone) settings.output_time_zone = *cl.output_zone;
    if (cl.ambiguous) settings.ambiguity = csvnorm::io::parseAmbiguityPolicy(*cl.ambiguous);
    if (cl.header) settings.header = csvnorm::io::parseHeaderPolicy(*cl.header);
    if (cl.precision) settings.duration_precision = *cl.precision;
    if (cl.pad_zip) settings.pad_zip = true;
    if (cl.recompute_total) settings.recompute_total = true;
    if (cl.quiet) settings.quiet = true;

    return settings;
}

} // namespace

int main(int argc, char* argv[]) {
    // Выходной поток только для данных; диагностика идёт в stderr
    std::ios::sync_with_stdio(false);

    CommandLine cl;
    try {
        cl = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Ошибка: " << e.what() << "\n\n";
        printUsage(std::cerr);
        return kExitUsage;
    }

    if (cl.help) {
        printUsage(std::cout);
        return kExitOk;
    }
    if (cl.version) {
        std::cout << "csvnorm " << CSVNORM_VERSION << " (" << CSVNORM_BUILD_TYPE << ")" << std::endl;
        return kExitOk;
    }
    if (cl.list_zones) {
        try {
            for (const auto& name : csvnorm::core::knownTimeZoneNames()) {
                std::cout << name << '\n';
            }
        } catch (const csvnorm::core::TimeZoneError& e) {
            std::cerr << "Ошибка: " << e.what() << std::endl;
            return kExitRuntime;
        }
        return kExitOk;
    }

    SanitizerSettings settings;
    std::optional<csvnorm::core::StreamSanitizer> sanitizer;
    try {
        settings = buildSettings(cl);
        sanitizer.emplace(settings);
    } catch (const csvnorm::io::SettingsError& e) {
        std::cerr << "Ошибка конфигурации: " << e.what() << std::endl;
        return kExitUsage;
    } catch (const csvnorm::core::TimeZoneError& e) {
        std::cerr << "Ошибка конфигурации: " << e.what() << std::endl;
        return kExitUsage;
    }

    try {
        auto stats = sanitizer->run(std::cin, std::cout, &std::cerr);
        if (!std::cout) {
            std::cerr << "Ошибка записи в stdout" << std::endl;
            return kExitRuntime;
        }

        if (cl.report_dir) {
            return csvnorm::app::writeReportCommand(settings, stats, *cl.report_dir);
        }
        return kExitOk;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return kExitRuntime;
    }
}
