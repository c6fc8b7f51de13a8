#ifndef LATTICE_TEST_CHECK_HPP
#define LATTICE_TEST_CHECK_HPP

#include <exception>
#include <functional>
#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include "../include/Lattice.h"

namespace Check {
    struct Failure : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    inline std::string location(const std::source_location& where) {
        return std::string(where.file_name()) + ":" + std::to_string(where.line());
    }

    inline void expect(bool condition, const std::source_location where = std::source_location::current()) {
        if (!condition) {
            throw Failure(location(where) + ": expectation failed");
        }
    }

    // Passes when `statement` throws `Error` (or a subclass); any other outcome is a failure.
    template <class Error, class Statement>
    void expect_throws(Statement&& statement, const std::source_location where = std::source_location::current()) {
        try {
            std::forward<Statement>(statement)();
        } catch (const Error&) {
            return;
        } catch (const std::exception& other) {
            throw Failure(location(where) + ": expected " + typeid(Error).name() + ", caught: " + other.what());
        }
        throw Failure(location(where) + ": expected " + typeid(Error).name() + ", nothing was thrown");
    }

    using Case = std::pair<std::string, std::function<void()>>;

    // Runs each case with a fresh session and returns the process exit code.
    inline int run(const std::vector<Case>& cases) {
        Lattice::Utils::Log::set_stream(nullptr);
        int failures = 0;
        for (const auto& [name, body] : cases) {
            Lattice::clear_session();
            try {
                body();
                std::cout << "[PASS] " << name << std::endl;
            } catch (const std::exception& error) {
                ++failures;
                std::cerr << "[FAIL] " << name << ": " << error.what() << '\n';
            }
        }
        Lattice::clear_session();
        Lattice::Utils::Log::reset_stream();
        if (failures != 0) {
            std::cerr << failures << " of " << cases.size() << " case(s) failed." << '\n';
            return 1;
        }
        std::cout << cases.size() << " case(s) passed." << std::endl;
        return 0;
    }
}

#endif // LATTICE_TEST_CHECK_HPP
