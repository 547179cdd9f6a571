#pragma once

#include "u64.hpp"
#include "hex_bytes.hpp"
#include "account_address.hpp"
#include "event_guid.hpp"
#include "hash.hpp"
