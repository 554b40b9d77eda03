/**
 * @file TempEnv.hpp
 * @brief RAII helpers for temporary files and environment variables
 */

#ifndef SHAPEQL_TESTS_TEMP_ENV_HPP
#define SHAPEQL_TESTS_TEMP_ENV_HPP

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace shapeql::testing {

/**
 * @brief File under the temp directory, removed on destruction
 */
class TempFile {
public:
    explicit TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(std::filesystem::temp_directory_path() /
                ("shapeql_test_" + std::to_string(next_id()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;

    static int next_id() {
        static std::atomic<int> counter{0};
        return ++counter;
    }
};

/**
 * @brief Sets a variable for the lifetime of the object, then restores it
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string name, const std::string& value)
        : name_(std::move(name)) {
        if (const char* original = std::getenv(name_.c_str())) {
            original_ = std::string(original);
        }
        set(value);
    }

    ~ScopedEnvVar() {
        if (original_) {
            set(*original_);
        } else {
#ifdef _WIN32
            _putenv_s(name_.c_str(), "");
#else
            unsetenv(name_.c_str());
#endif
        }
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    std::string name_;
    std::optional<std::string> original_;

    void set(const std::string& value) {
#ifdef _WIN32
        _putenv_s(name_.c_str(), value.c_str());
#else
        setenv(name_.c_str(), value.c_str(), 1);
#endif
    }
};

} // namespace shapeql::testing

#endif // SHAPEQL_TESTS_TEMP_ENV_HPP
