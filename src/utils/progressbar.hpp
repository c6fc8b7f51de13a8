#ifndef LATTICE_UTILS_PROGRESSBAR_HPP
#define LATTICE_UTILS_PROGRESSBAR_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace Lattice::Utils {
    // Single-line step counter redrawn with '\r'; a suffix (running loss, metrics) follows the bar.
    class ProgressBar {
    public:
        ProgressBar(std::ostream* stream, std::int64_t total, std::string label, std::size_t width = 30)
            : stream_(stream),
              total_(std::max<std::int64_t>(total, 0)),
              label_(std::move(label)),
              width_(std::max<std::size_t>(width, static_cast<std::size_t>(1))) {}

        void update(std::int64_t current, const std::string& suffix = {}) {
            if (stream_ == nullptr || finished_ || total_ <= 0) {
                return;
            }
            current = std::clamp<std::int64_t>(current, 0, total_);

            const double ratio = static_cast<double>(current) / static_cast<double>(total_);
            const auto full_cells = static_cast<std::size_t>(std::floor(ratio * static_cast<double>(width_)));

            std::ostringstream line;
            line << '\r' << label_ << " [";
            for (std::size_t i = 0; i < width_; ++i) {
                line << (i < full_cells ? "\xE2\x96\x88" : " ");
            }
            line << "] " << std::setw(3) << static_cast<int>(std::round(ratio * 100.0)) << "% ";
            line << '(' << current << '/' << total_ << ')';
            if (!suffix.empty()) {
                line << " - " << suffix;
            }
            *stream_ << line.str() << std::flush;

            if (current == total_) {
                finish();
            }
        }

        void finish() {
            if (finished_ || stream_ == nullptr) {
                return;
            }
            finished_ = true;
            *stream_ << std::endl;
        }

    private:
        std::ostream* stream_{nullptr};
        std::int64_t total_{0};
        std::string label_{};
        std::size_t width_{30};
        bool finished_{false};
    };
}

#endif // LATTICE_UTILS_PROGRESSBAR_HPP
