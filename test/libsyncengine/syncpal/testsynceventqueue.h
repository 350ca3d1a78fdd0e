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
#include "syncpal/synceventqueue.h"

namespace FSC {

class TestSyncEventQueue : public CppUnit::TestFixture {
        CPPUNIT_TEST_SUITE(TestSyncEventQueue);
        CPPUNIT_TEST(testLocalEvents);
        CPPUNIT_TEST(testMerge);
        CPPUNIT_TEST(testRoundDue);
        CPPUNIT_TEST(testTimeout);
        CPPUNIT_TEST(testWakeUp);
        CPPUNIT_TEST(testClose);
        CPPUNIT_TEST_SUITE_END();

    protected:
        void testLocalEvents();
        void testMerge();
        void testRoundDue();
        void testTimeout();
        void testWakeUp();
        void testClose();
};

} // namespace FSC
