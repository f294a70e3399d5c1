#include "tiercache/policy/eviction_fifo.h"
#include "tiercache/policy/eviction_lfu.h"
#include "tiercache/policy/eviction_lru.h"

#include "tiercache/errors.h"
#include "tiercache/item.h"
#include "tiercache/key_lock_registry.h"
#include "tiercache/presets.h"
#include "tiercache/tier.h"
#include "tiercache/tiered_cache.h"
