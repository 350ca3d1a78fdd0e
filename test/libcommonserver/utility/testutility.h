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

#include "testincludes.h"
#include "test_utility/testbase.h"

namespace FSC {

class TestUtility : public CppUnit::TestFixture, public TestBase {
        CPPUNIT_TEST_SUITE(TestUtility);
        CPPUNIT_TEST(testIsoTime);
        CPPUNIT_TEST(testItemPaths);
        CPPUNIT_TEST(testFileTypeFromName);
        CPPUNIT_TEST(testGenerateUuid);
        CPPUNIT_TEST(testFormat);
        CPPUNIT_TEST_SUITE_END();

    protected:
        void testIsoTime();
        void testItemPaths();
        void testFileTypeFromName();
        void testGenerateUuid();
        void testFormat();
};

} // namespace FSC
