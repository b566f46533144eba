#pragma once

// Primary public header for the sinkcoro writer-to-sink adapter library.
// Most users should include this header only.

// Error & result model
#include <sinkcoro/assert.hpp>
#include <sinkcoro/error.hpp>
#include <sinkcoro/expected.hpp>

// Coroutine model
#include <sinkcoro/awaitable.hpp>
#include <sinkcoro/co_spawn.hpp>

// Sink
#include <sinkcoro/item.hpp>
#include <sinkcoro/writer_sink.hpp>

// Writers & composed operations
#include <sinkcoro/io/fd_writer.hpp>
#include <sinkcoro/io/forward.hpp>
#include <sinkcoro/io/memory_writer.hpp>
#include <sinkcoro/io/writer_concepts.hpp>
