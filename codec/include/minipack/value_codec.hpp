/**
 * MiniPack - Whole-value encode and decode.
 */
#pragma once

#include "minipack/error.hpp"
#include "minipack/io.hpp"
#include "minipack/limits.hpp"
#include "minipack/value.hpp"

namespace minipack
{

    /// Decodes one value, copying every string and binary payload.
    /// Nesting beyond `limits.max_depth` or declared lengths beyond `limits.max_len` fail with LimitExceeded;
    /// the reserved marker fails with InvalidMarker.
    Result<Value> read_value(ByteSource &source, const Limits &limits = {});

    /// Decodes one value whose strings, binaries and ext payloads point into the source's storage.
    /// A payload that crosses a chunk boundary fails with FragmentedInput.
    Result<ValueRef> read_value_ref(BorrowSource &source, const Limits &limits = {});

    Result<void> write_value(ByteSink &sink, const Value &value);
    Result<void> write_value_ref(ByteSink &sink, const ValueRef &value);

} // namespace minipack
