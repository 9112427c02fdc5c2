/**
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * util/Misc.cpp
 *
 * Miscellaneous utilities.
 */

#include "internal.h"
#include "exceptions.h"
#include "util/Misc.h"

#include <fstream>
#include <sstream>
#include <vector>
#include <boost/algorithm/string.hpp>


using namespace samlsp;
using namespace std;

vector<string>::size_type samlsp::split_to_container(vector<string>& container, const char* s)
{
    if (s) {
        string dup(s);
        boost::trim(dup);
        if (!dup.empty()) {
            boost::split(container, dup, boost::is_space(), boost::token_compress_on);
        }
    }
    return container.size();
}

string FileSupport::read(const char* path)
{
    if (!path || !*path) {
        throw IOException("No file name supplied.");
    }

    ifstream in(path, ios_base::in | ios_base::binary);
    if (!in) {
        throw IOException(string("Unable to open file (") + path + ")");
    }

    ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw IOException(string("Error reading file (") + path + ")");
    }
    return buf.str();
}
