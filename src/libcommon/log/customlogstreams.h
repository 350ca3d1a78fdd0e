/*
 * FireSync - Desktop
 * Copyright (C) 2023-2025 Infomaniak Network SA
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once

#include <sstream>
#include <string>
#include <system_error>

//! The stream behind the LOG_* macros. Anything with an ostream operator can be logged.
class CustomLogStream {
    public:
        CustomLogStream() = default;
        CustomLogStream(const CustomLogStream &) = delete;
        CustomLogStream &operator=(const CustomLogStream &) = delete;

        std::string str() const { return _stream.str(); }

        CustomLogStream &operator<<(const bool b) {
            _stream << std::boolalpha << b << std::noboolalpha;
            return *this;
        }
        CustomLogStream &operator<<(const std::error_code &code) {
            _stream << code.value() << " (" << code.message() << ")";
            return *this;
        }

        template<typename T>
        CustomLogStream &operator<<(const T &value) {
            _stream << value;
            return *this;
        }

    private:
        std::ostringstream _stream;
};
