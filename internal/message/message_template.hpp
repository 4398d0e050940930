#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace eventship::message {

/*
  Renders a message template the way the host's message formatter does.

    %1 .. %99       insert string n (an optional !printf-format! suffix is
                    accepted and ignored); a missing insert renders empty
    %n              CRLF
    %t %r %b        tab, carriage return, space
    %% %. %!        the literal character
    %0              end of message, nothing after it is emitted
    %<other>        the character itself
*/
std::string RenderTemplate(std::string_view format, const std::vector<std::string>& inserts);

// Strips trailing CR/LF that message compilers append to every message.
std::string_view TrimLineBreaks(std::string_view text);

} // namespace eventship::message
