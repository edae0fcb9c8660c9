#include "network/http_response.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static string_view trim(string_view s)
// Remove surrounding whitespaces
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}
//---------------------------------------------------------------------------
optional<string_view> HttpResponse::header(string_view name) const
// Case-insensitive header lookup
{
    for (auto& keyValue : headers) {
        if (keyValue.first.size() == name.size() && equal(name.begin(), name.end(), keyValue.first.begin(), [](char a, char b) { return tolower(static_cast<unsigned char>(a)) == tolower(static_cast<unsigned char>(b)); }))
            return string_view(keyValue.second);
    }
    return nullopt;
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr char headerSeperator = ':';

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }
            line = line.substr(strHttp1_1.size());
            if (line.size() < 4 || line[0] != ' ')
                throw runtime_error("Invalid HttpResponse: Missing status code!");

            // the status code and the optional reason
            auto result = from_chars(line.data() + 1, line.data() + 4, response.code);
            if (result.ec != errc() || result.ptr != line.data() + 4 || response.code < 100 || response.code > 599)
                throw runtime_error("Invalid HttpResponse: Bad status code!");
            response.reason = trim(line.substr(4));
        } else {
            // headers
            auto keyPos = line.find(headerSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            response.headers.emplace(trim(line.substr(0, keyPos)), trim(line.substr(keyPos + 1)));
        }
    }

    return response;
}
//---------------------------------------------------------------------------
} // namespace dumpsync::network
