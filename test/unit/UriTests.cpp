//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "fsmcp/Support/Uri.h"

bool runUriTests()
{
    if (fsmcp::pathToUri("/work/src/app.ts") != "file:///work/src/app.ts")
    {
        std::cerr << "plain POSIX path should map to a file URI\n";
        return false;
    }

    const std::string spaced = fsmcp::pathToUri("/work/my project/caf\xC3\xA9#1.ts");
    if (spaced != "file:///work/my%20project/caf%C3%A9%231.ts")
    {
        std::cerr << "reserved and non-ASCII bytes should be percent-encoded: " << spaced << "\n";
        return false;
    }
    if (fsmcp::uriToPath(spaced) != "/work/my project/caf\xC3\xA9#1.ts")
    {
        std::cerr << "percent-encoded URI should decode to the original path\n";
        return false;
    }

    if (fsmcp::pathToUri("C:\\work\\app.ts") != "file:///C:/work/app.ts")
    {
        std::cerr << "drive-letter path should keep its colon and use forward slashes\n";
        return false;
    }
    if (fsmcp::uriToPath("file:///C:/work/app.ts") != "C:/work/app.ts")
    {
        std::cerr << "drive-letter URI should drop the authority slash\n";
        return false;
    }

    if (fsmcp::uriToPath("untitled:Untitled-1") != "untitled:Untitled-1")
    {
        std::cerr << "non-file URIs should be returned unchanged\n";
        return false;
    }
    if (fsmcp::uriToPath("file:///work/100%") != "/work/100%")
    {
        std::cerr << "a stray percent sign should be kept literally\n";
        return false;
    }
    return true;
}
