#pragma once
#include <atomic>
#include <cstddef>
#include <iosfwd>

namespace cmdgate {

class Dispatcher;

// Newline-delimited JSON-RPC over a stream pair. Requests are handled
// strictly one at a time: each response is written and flushed before
// the next line is read. Returns at EOF, or before reading the next
// line once *stop is set. Returns the number of responses written.
size_t run_stdio(const Dispatcher& dispatcher, std::istream& in, std::ostream& out,
                 const std::atomic<bool>* stop = nullptr);

} // namespace cmdgate
