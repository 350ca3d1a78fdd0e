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

#include "libcommonserver/log/log.h"

#include <Poco/Dynamic/Var.h>
#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include <log4cplus/loggingmacros.h>

#include <string>

namespace FSC {

//! Typed reads of the chunk store JSON replies.
struct JsonParserUtility {
        /**
         * Read `obj[key]` into `val`.
         * An explicit null, or an absent optional key, leaves `val` default constructed.
         * @return false if `obj` is null, or if a mandatory key is missing or of the wrong type.
         */
        template<typename T>
        static bool extractValue(const Poco::JSON::Object::Ptr &obj, const std::string &key, T &val,
                                 const bool mandatory = true) {
            val = T();
            if (!obj) {
                LOG_WARN(logger(), "No JSON object to read \"" << key << "\" from");
                return false;
            }
            if (!obj->has(key)) {
                if (mandatory) LOG_WARN(logger(), "Missing JSON key \"" << key << "\"");
                return !mandatory;
            }
            if (obj->isNull(key)) return true;

            try {
                obj->get(key).convert(val);
            } catch (const Poco::Exception &e) {
                LOG_WARN(logger(), "Bad JSON value for key \"" << key << "\" : " << e.displayText());
                val = T();
                return !mandatory;
            }
            return true;
        }

        //! Null, and logged, if `key` is not an array.
        static Poco::JSON::Array::Ptr extractArrayObject(const Poco::JSON::Object::Ptr &obj, const std::string &key) {
            Poco::JSON::Array::Ptr array;
            if (obj) array = obj->getArray(key);
            if (!array) LOG_WARN(logger(), "Missing JSON array \"" << key << "\"");
            return array;
        }

    private:
        static log4cplus::Logger logger() { return Log::instance()->getLogger(); }
};

} // namespace FSC
