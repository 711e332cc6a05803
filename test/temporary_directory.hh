#pragma once

#include <coderun/errmsg.hh>
#include <coderun/macros/throw.hh>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

// Creates a fresh directory under /tmp, removes it recursively on destruction
class TemporaryDirectory {
    std::string path_; // with trailing '/'

public:
    TemporaryDirectory() {
        std::string templ = "/tmp/coderun-test.XXXXXX";
        if (mkdtemp(templ.data()) == nullptr) {
            THROW("mkdtemp()", errmsg());
        }
        path_ = templ + '/';
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec); // we cannot throw from a destructor
    }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
