#ifndef NABLA_PROGRESSBAR_HPP
#define NABLA_PROGRESSBAR_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace Nabla::Utils {
    class ProgressBar {
    public:
        ProgressBar(std::int64_t total, std::string label, std::ostream& stream = std::cout, std::size_t width = 30)
            : stream_(&stream),
              total_(std::max<std::int64_t>(total, 0)),
              label_(std::move(label)),
              width_(std::max<std::size_t>(width, static_cast<std::size_t>(1))),
              last_units_(-1),
              finished_(false) {}

        void update(std::int64_t current, std::string_view suffix = {}) {
            if (finished_ || total_ <= 0) {
                return;
            }
            current = std::clamp<std::int64_t>(current, 0, total_);

            // Eighth-of-a-cell resolution.
            const double ratio = static_cast<double>(current) / static_cast<double>(total_);
            const auto scaled_units = std::min<std::int64_t>(static_cast<std::int64_t>(std::round(ratio * width_ * 8.0)),
                                                             static_cast<std::int64_t>(width_) * 8);

            if (scaled_units == last_units_ && current != total_ && suffix.empty()) {
                return;
            }
            last_units_ = scaled_units;

            const std::size_t full_cells = static_cast<std::size_t>(scaled_units / 8);
            const auto partial_index = static_cast<std::size_t>(scaled_units % 8);

            std::ostringstream stream;
            stream << '\r' << label_ << " [";
            for (std::size_t i = 0; i < full_cells && i < width_; ++i) {
                stream << "\xE2\x96\x88";
            }

            const bool has_partial_cell = partial_index > 0 && full_cells < width_;
            if (has_partial_cell) {
                stream << PartialBlock(partial_index);
            }

            const std::size_t printed_cells = full_cells + (has_partial_cell ? 1 : 0);
            if (printed_cells < width_) {
                stream << std::string(width_ - printed_cells, ' ');
            }

            stream << "] ";
            stream << std::setw(3) << static_cast<int>(std::round(ratio * 100.0)) << "% ";
            stream << '(' << current << '/' << total_ << ')';
            if (!suffix.empty()) {
                stream << ' ' << suffix;
            }

            *stream_ << stream.str() << std::flush;

            if (current == total_) {
                finish();
            }
        }

    private:
        static const char* PartialBlock(std::size_t index) { // smooth pBar
            static constexpr const char* blocks[] = {
                "",
                "\xE2\x96\x8F",
                "\xE2\x96\x8E",
                "\xE2\x96\x8D",
                "\xE2\x96\x8C",
                "\xE2\x96\x8B",
                "\xE2\x96\x8A",
                "\xE2\x96\x89"
            };
            return blocks[std::min<std::size_t>(index, 7)];
        }

        void finish() {
            if (finished_) {
                return;
            }
            finished_ = true;
            *stream_ << std::endl;
        }

        std::ostream* stream_;
        std::int64_t total_;
        std::string label_;
        std::size_t width_;
        std::int64_t last_units_;
        bool finished_;
    };
}

#endif // NABLA_PROGRESSBAR_HPP