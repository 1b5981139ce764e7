/**
 * @file stream_sanitizer.cpp
 * @brief Построчная нормализация потока CSV
 */

#include "stream_sanitizer.hpp"
#include "io/text_utils.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace csvnorm::core {

namespace {

std::string shortPreview(const std::string& text) {
    constexpr size_t kMaxLength = 160;
    if (text.size() <= kMaxLength) {
        return text;
    }
    // Не разрезаем многобайтовый символ
    size_t cut = kMaxLength;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

} // namespace

StreamSanitizer::StreamSanitizer(const SanitizerSettings& settings)
    : rows_(settings) {}

StreamSanitizer::StreamSanitizer(RowSanitizer rows)
    : rows_(std::move(rows)) {}

RunStatistics StreamSanitizer::run(std::istream& in, std::ostream& out, std::ostream* diag) const {
    const auto& settings = rows_.settings();
    if (settings.quiet) {
        diag = nullptr;
    }

    RunStatistics stats;
    std::string line;
    size_t line_no = 0;
    bool first_row = true;

    while (std::getline(in, line)) {
        ++line_no;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string repaired = io::repairUtf8(line_no == 1 ? io::stripBom(line) : std::string_view(line));
        if (repaired.empty()) {
            ++stats.blank_lines;
            continue;
        }

        ++stats.rows_read;
        auto outcome = rows_.process(repaired, first_row);
        first_row = false;

        switch (outcome.kind) {
            case model::RowOutcome::Kind::Emitted:
                out << outcome.line << '\n';
                ++stats.rows_written;
                break;

            case model::RowOutcome::Kind::Header:
                ++stats.header_rows;
                if (settings.header == model::HeaderPolicy::Pass) {
                    out << outcome.line << '\n';
                }
                break;

            case model::RowOutcome::Kind::Dropped:
                stats.recordDrop(line_no, outcome.reason, outcome.detail, settings.max_drop_samples);
                if (diag) {
                    *diag << "ПРЕДУПРЕЖДЕНИЕ: строка " << line_no << " отброшена ("
                          << model::dropReasonToString(outcome.reason) << "): "
                          << outcome.detail << " | " << shortPreview(repaired) << '\n';
                }
                break;
        }
    }

    out.flush();

    if (diag) {
        *diag << "Прочитано: " << stats.rows_read
              << ", записано: " << stats.rows_written
              << ", отброшено: " << stats.rows_dropped << '\n';
    }

    return stats;
}

} // namespace csvnorm::core
