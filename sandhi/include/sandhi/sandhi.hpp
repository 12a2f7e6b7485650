#pragma once
// Sandhi: intent stack, intent transfer and slot inheritance for dialogue
//
// - Stack: bounded per-session frames with preemption and resumption
// - Transfer: rule engine deciding push / pop / replace on each turn
// - Inheritance: multi-source slot filling with a fingerprinted cache
// - Storage: KVStore over memory or SQLite
// - Sweeper: background removal of expired frames

#include "types.hpp"
#include "errors.hpp"
#include "version.hpp"
#include "config.hpp"
#include "store.hpp"
#include "sqlite_store.hpp"
#include "catalog.hpp"
#include "intent_frame.hpp"
#include "intent_stack.hpp"
#include "sweeper.hpp"
#include "collaborators.hpp"
#include "keyword_classifier.hpp"
#include "transfer_rules.hpp"
#include "transfer_log.hpp"
#include "transfer_engine.hpp"
#include "transforms.hpp"
#include "slot_inheritance.hpp"
#include "inheritance_cache.hpp"
#include "inheritance_manager.hpp"
