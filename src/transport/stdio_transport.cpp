#include "transport/stdio_transport.hpp"
#include "dispatcher.hpp"
#include "util.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace cmdgate {

size_t run_stdio(const Dispatcher& dispatcher, std::istream& in, std::ostream& out,
                 const std::atomic<bool>* stop) {
    size_t written = 0;
    std::string line;
    while (!(stop && stop->load()) && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        auto reply = dispatcher.handle_message(line);
        if (!reply) continue;
        out << *reply << '\n';
        out.flush();
        ++written;
    }
    return written;
}

} // namespace cmdgate
