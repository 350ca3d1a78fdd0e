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

#include "libparms/parameters.h"

#include <memory>

namespace FSC {

//! Process-wide parameters, loaded once at start-up by the daemon.
class ParametersCache {
    public:
        //! `isTest` turns the extended log on when the instance is created.
        static std::shared_ptr<ParametersCache> instance(bool isTest = false);
        static void reset() { _instance.reset(); }
        static bool isExtendedLogEnabled() noexcept { return instance()->_parameters.extendedLog(); }

        ParametersCache(const ParametersCache &) = delete;
        ParametersCache &operator=(const ParametersCache &) = delete;

        Parameters &parameters() { return _parameters; }
        //! The logger follows a change of useLog or logLevel.
        void setParameters(const Parameters &parameters);

    private:
        explicit ParametersCache(bool isTest);

        static std::shared_ptr<ParametersCache> _instance;
        Parameters _parameters;
};

} // namespace FSC
