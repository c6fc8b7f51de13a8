#ifndef LATTICE_UTILS_LOG_HPP
#define LATTICE_UTILS_LOG_HPP

#include <iostream>
#include <mutex>
#include <ostream>
#include <string_view>

#include "terminal.hpp"

namespace Lattice::Utils::Log {
    namespace Details {
        struct Sink {
            std::ostream* stream{&std::cerr};
            bool colored{true};
            std::mutex mutex{};
        };

        inline Sink& sink() {
            static Sink instance{};
            return instance;
        }

        inline void emit(std::string_view color, std::string_view symbol, std::string_view level, std::string_view message) {
            auto& target = sink();
            std::lock_guard<std::mutex> lock(target.mutex);
            if (target.stream == nullptr) {
                return;
            }
            auto& out = *target.stream;
            if (target.colored) {
                out << color << symbol << " [Lattice] " << level << ": " << Terminal::Colors::kReset << message << '\n';
            } else {
                out << "[Lattice] " << level << ": " << message << '\n';
            }
            out.flush();
        }
    }

    // Redirects every subsequent log line; nullptr silences the library.
    inline void set_stream(std::ostream* stream, bool colored = true) {
        auto& target = Details::sink();
        std::lock_guard<std::mutex> lock(target.mutex);
        target.stream = stream;
        target.colored = colored;
    }

    inline void reset_stream() { set_stream(&std::cerr, true); }

    inline void info(std::string_view message) {
        Details::emit(Terminal::Colors::kAzure, Terminal::Symbols::kInfo, "info", message);
    }

    inline void warning(std::string_view message) {
        Details::emit(Terminal::Colors::kOrange, Terminal::Symbols::kWarn, "warning", message);
    }
}

#endif // LATTICE_UTILS_LOG_HPP
