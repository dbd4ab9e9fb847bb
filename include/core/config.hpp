// config.hpp
#pragma once
#include <cstdint>

// Compile-time configuration for the allocation engine.
//
// Ticket counts are machine integers; weights and thresholds never are
// (see core/rational.hpp). Search caps only bound work, they never change
// which assignments are accepted.

#ifndef CORE_TICKET_T
#define CORE_TICKET_T std::uint64_t
#endif

// Binary search step cap for the proportional allocation. 64 steps already
// cover the whole ticket_t range; anything beyond is a defect, not a slow
// instance.
#ifndef CORE_SEARCH_MAX_STEPS
#define CORE_SEARCH_MAX_STEPS 256
#endif

// Default number of oracle calls the exhaustive search below the
// proportional total may spend. Past it the result is valid but not proven
// minimal.
#ifndef CORE_SEARCH_MAX_NODES
#define CORE_SEARCH_MAX_NODES 4096
#endif

// Default number of totals the ascending scan tries, starting at the lower
// bound, when the thresholds admit no closed-form bound (WR with tw >= tn,
// WQ with tw <= tn).
#ifndef CORE_FALLBACK_MAX_TICKETS
#define CORE_FALLBACK_MAX_TICKETS 256
#endif

// Global hardening switch for optional runtime assertions in debug/testing code.
// Set via compile flag: -DCORE_HARDENED=1
#ifndef CORE_HARDENED
#define CORE_HARDENED 0
#endif

#if CORE_HARDENED
#include <stdexcept>
#define CORE_ASSERT_H(cond, msg) do { if(!(cond)) throw std::runtime_error(msg); } while(0)
#else
#define CORE_ASSERT_H(cond, msg) do { } while(0)
#endif

// ticket_t is used widely in the engine and by callers; keep a global alias
// for brevity and also provide a namespaced alias.
using ticket_t = CORE_TICKET_T;
namespace core { using ticket_t = ::ticket_t; }
