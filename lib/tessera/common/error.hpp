/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_COMMON_ERROR_HPP
#define TESSERA_COMMON_ERROR_HPP

#include <array>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tessera {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    protected:
        // allows subclasses to extend the message after the construction, e.g., with a byte position
        void _set_message(std::string_view msg);
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        // appends the description of the nested exception, e.g., a stream failure behind a frame error
        explicit error(std::string_view msg, const std::exception_ptr &cause);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };

    // the dynamic type and the message of a captured exception
    extern std::string describe_exception(const std::exception_ptr &ex);
}

#endif // !TESSERA_COMMON_ERROR_HPP
