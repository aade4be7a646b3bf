/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Shelf.
 *
 * Shelf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Shelf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Shelf.  If not, see <http://www.gnu.org/licenses/>.
 */


#pragma once

#include <string>

#include "core/Exception.hpp"

namespace shelf::api
{
    // Request errors, reported to the client using the given HTTP status
    class Error : public core::ShelfException
    {
    public:
        Error(int httpStatus, const std::string& message)
            : core::ShelfException{ message }
            , _httpStatus{ httpStatus } {}

        int getHttpStatus() const { return _httpStatus; }

    private:
        int _httpStatus;
    };

    class BadParameterError : public Error
    {
    public:
        BadParameterError(const std::string& parameter, const std::string& reason)
            : Error{ 400, "Bad parameter '" + parameter + "': " + reason } {}
    };

    class UnknownEndpointError : public Error
    {
    public:
        UnknownEndpointError()
            : Error{ 404, "Unknown endpoint" } {}
    };

    class MethodNotAllowedError : public Error
    {
    public:
        MethodNotAllowedError(const std::string& method)
            : Error{ 405, "Method " + method + " not allowed" } {}
    };

    // HTTP status to report for any project exception
    int getHttpStatus(const core::ShelfException& exception);
} // namespace shelf::api
