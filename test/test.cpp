/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include <cstdlib>
#include <iostream>

#include <cppunit/BriefTestProgressListener.h>
#include <cppunit/CompilerOutputter.h>
#include <cppunit/TestFailure.h>
#include <cppunit/TestResult.h>
#include <cppunit/TestResultCollector.h>
#include <cppunit/TestRunner.h>
#include <cppunit/extensions/TestFactoryRegistry.h>

#include <Poco/RegularExpression.h>

#include <Log.hpp>

bool filterTests(CPPUNIT_NS::TestRunner& runner, CPPUNIT_NS::Test* testRegistry, const std::string& testName)
{
    Poco::RegularExpression re(testName, Poco::RegularExpression::RE_CASELESS);
    Poco::RegularExpression::Match reMatch;

    bool haveTests = false;
    for (int i = 0; i < testRegistry->getChildTestCount(); ++i)
    {
        CPPUNIT_NS::Test* testSuite = testRegistry->getChildTestAt(i);
        for (int j = 0; j < testSuite->getChildTestCount(); ++j)
        {
            CPPUNIT_NS::Test* testCase = testSuite->getChildTestAt(j);
            if (re.match(testCase->getName(), reMatch))
            {
                runner.addTest(testCase);
                haveTests = true;
            }
        }
    }

    return haveTests;
}

int main(int argc, char** argv)
{
    bool verbose = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg(argv[i]);
        if (arg == "--verbose")
        {
            verbose = true;
        }
        else
        {
            std::cerr << "Usage: " << argv[0] << " [--verbose]" << std::endl;
            return EXIT_FAILURE;
        }
    }

    const char* loglevel = std::getenv("WOPI_LOGLEVEL");
    Log::initialize("unittest", loglevel ? loglevel : (verbose ? "trace" : "warning"));

    CPPUNIT_NS::TestResult controller;
    CPPUNIT_NS::TestResultCollector result;
    controller.addListener(&result);
    CPPUNIT_NS::BriefTestProgressListener progress;
    controller.addListener(&progress);

    CPPUNIT_NS::Test* testRegistry = CPPUNIT_NS::TestFactoryRegistry::getRegistry().makeTest();

    CPPUNIT_NS::TestRunner runner;
    const char* envar = std::getenv("CPPUNIT_TEST_NAME");
    const std::string testName = envar ? envar : std::string();
    if (testName.empty())
    {
        // Add all tests.
        runner.addTest(testRegistry);
    }
    else if (!filterTests(runner, testRegistry, testName))
    {
        std::cerr << "Failed to match [" << testName << "] to any names in the test-suite. "
                  << "No tests will be executed" << std::endl;
    }

    runner.run(controller);

    CPPUNIT_NS::CompilerOutputter outputter(&result, std::cerr);
    outputter.setNoWrap();
    outputter.write();

    const std::deque<CPPUNIT_NS::TestFailure*>& failures = result.failures();
    if (!envar && !failures.empty())
    {
        std::cerr << "\nTo reproduce the first test failure use:\n\n"
                  << "  CPPUNIT_TEST_NAME=\"" << (*failures.begin())->failedTestName()
                  << "\" ./unittest --verbose\n\n";
    }

    Log::shutdown();
    return result.wasSuccessful() ? EXIT_SUCCESS : EXIT_FAILURE;
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
