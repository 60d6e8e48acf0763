/// @file HashMap.hpp
/// @brief Header-only closed-hashing map with jump probing, tombstones and mutation-checked cursors.
///
/// Semantics / constraints:
/// - The bucket count is always prime (see `Math::Primes`). Probing is double hashing ("jump probing"):
///   start at `hash % size`, step by `HashMapParams::CalcJump(hash, size)`, which visits every bucket
///   exactly once per `size` steps.
/// - Each bucket carries a tag: `0` never used, `> 0` live (the 31-bit hash of its key), `< 0` tombstone.
/// - Removal leaves a tombstone with the key still in place so other probe chains stay intact.
///   Inserts reuse the first tombstone on their path; only a rehash purges tombstones.
/// - Entries never move except during a rehash, so slot indices stay valid until the next growth,
///   `Rehash()`, `ResetCapacity()`, `EnsureCapacity()` or `ClearAndShrink()`.
/// - Empty and tombstoned buckets hold default-constructed payloads.
/// - Not thread-safe. A `Cursor` borrows its table and must not outlive it.

#pragma once

#include <ORE/Config.hpp>
#include <ORE/Defines.hpp>
#include <ORE/Primitives.hpp>
#include <ORE/Containers/HashMapError.hpp>
#include <ORE/Containers/HashMapParams.hpp>
#include <ORE/Hashing/Hashing.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace ORE::Containers
{
    /// @brief Decoded state of a single bucket.
    enum class SlotState : UInt8
    {
        Empty,
        Live,
        Tombstone,
    };

    /// @brief Value-equality capability that disables value-based queries (they report false).
    struct NoValueEqual
    {
    };

    /// @brief Read-only snapshot for external instrumentation.
    struct HashMapDiagnostics
    {
        UInt32 count {0};
        UInt32 bucketCount {0};
        UInt32 loadLimit {0};
        UInt32 tombstones {0};
        UInt32 collisions {0};
        F32    loadRatio {0.0f};
        UInt64 version {0};
    };

    /// @brief Closed-hashing map.
    ///
    /// Design notes:
    /// - Jump probing over a prime-sized bucket array.
    /// - Tombstone deletion, reclaimed by later inserts.
    /// - Every structural mutation bumps `Version()`; cursors use it to detect foreign mutation.
    template<typename Key,
             typename Value,
             typename Hash       = Hashing::KeyHash<Key>,
             typename KeyEqual   = std::equal_to<Key>,
             typename ValueEqual = std::equal_to<Value>>
    class HashMap
    {
    public:
        using key_type         = Key;
        using mapped_type      = Value;
        using hash_type        = Hash;
        using key_equal        = KeyEqual;
        using value_equal      = ValueEqual;
        using size_type        = UInt32;

        /// @brief Tag stored for keys whose masked hash is zero (zero marks an unused bucket).
        static constexpr UInt32 kZeroHashTag = 0x7FFFFFFFu;

        static constexpr bool kHasValueEqual = !std::is_same_v<ValueEqual, NoValueEqual>;

        static_assert(std::is_default_constructible_v<Key> && std::is_default_constructible_v<Value>,
                      "HashMap requires default constructible Key and Value (unused buckets hold defaults).");
        static_assert(std::is_nothrow_move_assignable_v<Key> && std::is_nothrow_move_assignable_v<Value>,
                      "HashMap requires nothrow move assignable Key and Value (rehash relocates entries).");

        struct KeyValueRef
        {
            const Key& key;
            Value&     value;
        };

        struct KeyValueConstRef
        {
            const Key&   key;
            const Value& value;
        };

        class Cursor;
        class ConstIterator;

        HashMap() { Initialize_(m_params.initialSize); }

        /// @brief Builds a table from a sizing policy.
        ///
        /// A policy failing `HashMapParams::Check()` is replaced by the default policy; the
        /// substitution is reported on stderr and through `ConfigurationError()`.
        explicit HashMap(const HashMapParams& params,
                         const Hash&          hash       = Hash {},
                         const KeyEqual&      keyEqual   = KeyEqual {},
                         const ValueEqual&    valueEqual = ValueEqual {})
            : m_hash(hash), m_keyEqual(keyEqual), m_valueEqual(valueEqual)
        {
            AdoptParams_(params);
            Initialize_(m_params.initialSize);
        }

        /// @brief Growable table sized for `userCapacity` entries.
        explicit HashMap(UInt32 userCapacity)
            : HashMap(HashMapParams(userCapacity))
        {
        }

        /// @brief Builds a table from parallel key and value sequences.
        ///
        /// Keys past the end of `values` map to `Value {}`; surplus values are ignored. A repeated key
        /// keeps its last value. Sized key ranges reserve capacity up front.
        /// @throws std::length_error when a fixed-size policy cannot hold every key.
        template<std::ranges::input_range KeyRange, std::ranges::input_range ValueRange>
            requires std::is_constructible_v<Key, std::ranges::range_reference_t<KeyRange>> &&
                     std::is_assignable_v<Value&, std::ranges::range_reference_t<ValueRange>>
        HashMap(KeyRange&& keys, ValueRange&& values, const HashMapParams& params = HashMapParams {})
            : HashMap(params)
        {
            if constexpr (std::ranges::sized_range<KeyRange>)
                EnsureCapacity(static_cast<UInt32>(std::ranges::size(keys)));

            auto       valueIt  = std::ranges::begin(values);
            const auto valueEnd = std::ranges::end(values);
            for (auto&& key: keys)
            {
                MapExpected<SlotIndex> result;
                if (valueIt != valueEnd)
                {
                    result = Remap(std::forward<decltype(key)>(key), *valueIt);
                    ++valueIt;
                }
                else
                {
                    result = Remap(std::forward<decltype(key)>(key), Value {});
                }

                if (!result)
                    throw std::length_error("HashMap capacity exceeded while building from ranges");
            }
        }

        HashMap(const HashMap& other)
            : m_params(other.m_params),
              m_hash(other.m_hash),
              m_keyEqual(other.m_keyEqual),
              m_valueEqual(other.m_valueEqual),
              m_collisions(other.m_collisions),
              m_configError(other.m_configError)
        {
            if (!other.m_buckets)
            {
                Initialize_(m_params.initialSize);
                return;
            }

            Initialize_(other.m_size);
            for (UInt32 i = 0; i < m_size; ++i)
            {
                m_buckets[i] = other.m_buckets[i];
                if (m_buckets[i].tag > 0)
                    ++m_count;
            }
        }

        HashMap& operator=(const HashMap& other)
        {
            if (this == &other)
                return *this;
            *this = HashMap(other);
            return *this;
        }

        HashMap(HashMap&& other) noexcept
            : m_params(other.m_params),
              m_hash(std::move(other.m_hash)),
              m_keyEqual(std::move(other.m_keyEqual)),
              m_valueEqual(std::move(other.m_valueEqual)),
              m_buckets(std::move(other.m_buckets)),
              m_size(std::exchange(other.m_size, 0)),
              m_loadLimit(std::exchange(other.m_loadLimit, 0)),
              m_count(std::exchange(other.m_count, 0)),
              m_deferredRemovals(std::exchange(other.m_deferredRemovals, 0)),
              m_collisions(std::exchange(other.m_collisions, 0)),
              m_version(other.m_version),
              m_configError(other.m_configError)
        {
            ++other.m_version;
        }

        HashMap& operator=(HashMap&& other) noexcept
        {
            if (this == &other)
                return *this;

            const UInt64 version = std::max(m_version, other.m_version) + 1;

            m_params           = other.m_params;
            m_hash             = std::move(other.m_hash);
            m_keyEqual         = std::move(other.m_keyEqual);
            m_valueEqual       = std::move(other.m_valueEqual);
            m_buckets          = std::move(other.m_buckets);
            m_size             = std::exchange(other.m_size, 0);
            m_loadLimit        = std::exchange(other.m_loadLimit, 0);
            m_count            = std::exchange(other.m_count, 0);
            m_deferredRemovals = std::exchange(other.m_deferredRemovals, 0);
            m_collisions       = std::exchange(other.m_collisions, 0);
            m_configError      = other.m_configError;
            m_version          = version;

            ++other.m_version;
            return *this;
        }

        ~HashMap() = default;

        //--------------------------------------------------------------------------
        // Insertion
        //--------------------------------------------------------------------------

        /// @brief Maps `key` to `value`.
        ///
        /// @param overwrite Replace the value of an existing mapping instead of reporting it.
        /// @return The slot now holding the entry, `KeyAlreadyMapped` (with the existing slot) when
        ///         `overwrite` is false and the key exists, or `CapacityExceeded` when the table is
        ///         full and cannot grow.
        template<class K, class V>
            requires std::is_constructible_v<Key, K&&> && std::is_assignable_v<Value&, V&&>
        MapExpected<SlotIndex> Insert(K&& key, V&& value, bool overwrite = false)
        {
            if constexpr (std::is_same_v<std::remove_cvref_t<K>, Key>)
                return InsertImpl_(std::forward<K>(key), std::forward<V>(value), overwrite);
            else
                return InsertImpl_(Key(std::forward<K>(key)), std::forward<V>(value), overwrite);
        }

        /// @brief Non-overwriting insert.
        template<class K, class V>
            requires std::is_constructible_v<Key, K&&> && std::is_assignable_v<Value&, V&&>
        [[nodiscard]] MapExpected<SlotIndex> TryInsert(K&& key, V&& value)
        {
            return Insert(std::forward<K>(key), std::forward<V>(value), false);
        }

        /// @brief Overwriting insert.
        template<class K, class V>
            requires std::is_constructible_v<Key, K&&> && std::is_assignable_v<Value&, V&&>
        MapExpected<SlotIndex> Remap(K&& key, V&& value)
        {
            return Insert(std::forward<K>(key), std::forward<V>(value), true);
        }

        //--------------------------------------------------------------------------
        // Lookup
        //--------------------------------------------------------------------------

        [[nodiscard]] std::optional<SlotIndex> FindSlot(const Key& key) const
        {
            const Probe probe = Probe_(key, Hash31_(key));
            if (probe.found == kNoSlot)
                return std::nullopt;
            return probe.found;
        }

        [[nodiscard]] Value* Find(const Key& key)
        {
            const auto slot = FindSlot(key);
            return slot ? &m_buckets[*slot].value : nullptr;
        }

        [[nodiscard]] const Value* Find(const Key& key) const
        {
            const auto slot = FindSlot(key);
            return slot ? &m_buckets[*slot].value : nullptr;
        }

        [[nodiscard]] bool ContainsKey(const Key& key) const { return FindSlot(key).has_value(); }

        [[nodiscard]] Value Get(const Key& key) const
        {
            const Value* p = Find(key);
            if (!p)
                throw std::out_of_range("Key not found in hashmap");
            return *p;
        }

        [[nodiscard]] Value GetOrDefault(const Key& key) const
        {
            const Value* p = Find(key);
            return p ? *p : Value {};
        }

        /// @brief True when some live entry holds `value`. Always false without a value-equality capability.
        [[nodiscard]] bool ContainsValue(const Value& value) const
        {
            if constexpr (!kHasValueEqual)
            {
                (void) value;
                return false;
            }
            else
            {
                for (UInt32 i = 0; i < m_size; ++i)
                {
                    if (m_buckets[i].tag > 0 && m_valueEqual(m_buckets[i].value, value))
                        return true;
                }
                return false;
            }
        }

        /// @brief True when `key` maps to `value`. Always false without a value-equality capability.
        [[nodiscard]] bool Contains(const Key& key, const Value& value) const
        {
            if constexpr (!kHasValueEqual)
            {
                (void) key;
                (void) value;
                return false;
            }
            else
            {
                const Value* p = Find(key);
                return p && m_valueEqual(*p, value);
            }
        }

        //--------------------------------------------------------------------------
        // Removal
        //--------------------------------------------------------------------------

        /// @brief Removes `key`, leaving a tombstone.
        /// @return The value that was mapped, or empty when the key is absent (no mutation).
        std::optional<Value> Remove(const Key& key)
        {
            const auto slot = FindSlot(key);
            if (!slot)
                return std::nullopt;

            std::optional<Value> removed(std::move(m_buckets[*slot].value));
            Bury_(*slot);
            --m_count;
            ++m_version;
            return removed;
        }

        /// @brief Removes the exact pair `key -> value`. Always false without a value-equality capability.
        bool Remove(const Key& key, const Value& value)
        {
            if constexpr (!kHasValueEqual)
            {
                (void) key;
                (void) value;
                return false;
            }
            else
            {
                const auto slot = FindSlot(key);
                if (!slot || !m_valueEqual(m_buckets[*slot].value, value))
                    return false;

                Bury_(*slot);
                --m_count;
                ++m_version;
                return true;
            }
        }

        /// @brief Removes `key` and moves its value into `out`.
        bool Pop(const Key& key, Value& out)
        {
            auto removed = Remove(key);
            if (!removed)
                return false;
            out = std::move(*removed);
            return true;
        }

        /// @brief Drops every payload and tombstone, keeping the bucket array.
        void Clear()
        {
            for (UInt32 i = 0; i < m_size; ++i)
            {
                Bucket& b = m_buckets[i];
                if (b.tag == 0)
                    continue;
                b.key   = Key {};
                b.value = Value {};
                b.tag   = 0;
            }
            m_count            = 0;
            m_deferredRemovals = 0;
            ++m_version;
        }

        /// @brief Drops every payload and reallocates at the policy's initial size.
        void ClearAndShrink()
        {
            Initialize_(m_params.initialSize);
            ++m_version;
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        /// @brief Grows the table so it can hold at least `loadLimit` entries. Never shrinks.
        /// @return Whether the table can now hold `loadLimit` entries (fixed-size tables never grow).
        bool EnsureCapacity(UInt32 loadLimit)
        {
            EnsureAllocated_();
            if (!m_params.IsFixedSize() && loadLimit > m_loadLimit)
            {
                const UInt32 target = m_params.CalcInternalSize(loadLimit);
                if (target > m_size)
                    Rehash_(target);
            }
            return m_loadLimit >= loadLimit;
        }

        /// @brief Rehashes to the initial size, or the smallest size that still fits the live entries.
        void ResetCapacity()
        {
            UInt32 target = m_params.initialSize;
            if (m_params.CalcLoadLimit(target) < m_count)
                target = m_params.CalcInternalSize(m_count);
            Rehash_(target);
        }

        /// @brief Rebuilds the table at its current size, purging tombstones.
        void Rehash() { Rehash_(m_buckets ? m_size : m_params.initialSize); }

        //--------------------------------------------------------------------------
        // Diagnostics
        //--------------------------------------------------------------------------

        [[nodiscard]] ORE_ALWAYS_INLINE UInt32 Count() const noexcept { return m_count; }
        [[nodiscard]] ORE_ALWAYS_INLINE bool IsEmpty() const noexcept { return m_count == 0; }
        /// @brief Live entries the table holds before it must grow (the load limit).
        [[nodiscard]] ORE_ALWAYS_INLINE UInt32 Capacity() const noexcept { return m_loadLimit; }
        [[nodiscard]] ORE_ALWAYS_INLINE UInt32 BucketCount() const noexcept { return m_size; }
        [[nodiscard]] ORE_ALWAYS_INLINE UInt32 Collisions() const noexcept { return m_collisions; }
        [[nodiscard]] ORE_ALWAYS_INLINE UInt64 Version() const noexcept { return m_version; }
        [[nodiscard]] ORE_ALWAYS_INLINE bool IsFixedSize() const noexcept { return m_params.IsFixedSize(); }
        [[nodiscard]] ORE_ALWAYS_INLINE const HashMapParams& Params() const noexcept { return m_params; }

        /// @brief `InvalidConfiguration` when the constructor fell back to the default policy.
        [[nodiscard]] MapError ConfigurationError() const noexcept { return m_configError; }

        [[nodiscard]] F32 LoadRatio() const noexcept
        {
            if (m_size == 0)
                return 0.0f;
            return static_cast<F32>(m_count) / static_cast<F32>(m_size);
        }

        void ResetCollisions() noexcept { m_collisions = 0; }

        [[nodiscard]] HashMapDiagnostics GetDiagnostics() const noexcept
        {
            HashMapDiagnostics diagnostics;
            diagnostics.count       = m_count;
            diagnostics.bucketCount = m_size;
            diagnostics.loadLimit   = m_loadLimit;
            diagnostics.collisions  = m_collisions;
            diagnostics.loadRatio   = LoadRatio();
            diagnostics.version     = m_version;
            for (UInt32 i = 0; i < m_size; ++i)
            {
                if (m_buckets[i].tag < 0)
                    ++diagnostics.tombstones;
            }
            return diagnostics;
        }

        /// @brief State of bucket `slot`; out-of-range slots read as empty.
        [[nodiscard]] SlotState SlotStateAt(SlotIndex slot) const noexcept
        {
            if (slot >= m_size)
                return SlotState::Empty;
            const Int32 tag = m_buckets[slot].tag;
            if (tag > 0)
                return SlotState::Live;
            return tag < 0 ? SlotState::Tombstone : SlotState::Empty;
        }

        /// @pre `SlotStateAt(slot) == SlotState::Live`.
        [[nodiscard]] const Key& KeyAt(SlotIndex slot) const noexcept { return m_buckets[slot].key; }
        /// @pre `SlotStateAt(slot) == SlotState::Live`.
        [[nodiscard]] Value& ValueAt(SlotIndex slot) noexcept { return m_buckets[slot].value; }
        /// @pre `SlotStateAt(slot) == SlotState::Live`.
        [[nodiscard]] const Value& ValueAt(SlotIndex slot) const noexcept { return m_buckets[slot].value; }

        //--------------------------------------------------------------------------
        // Iteration
        //--------------------------------------------------------------------------

        /// @brief Read-only forward iterator over live entries. Any mutation invalidates it.
        class ConstIterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using value_type        = KeyValueConstRef;
            using reference         = KeyValueConstRef;
            using pointer           = void;
            using iterator_category = std::input_iterator_tag;

            ConstIterator() = default;
            ConstIterator(const HashMap* map, UInt32 idx) : m_map(map), m_index(idx) { Advance_(); }

            reference operator*() const { return {m_map->m_buckets[m_index].key, m_map->m_buckets[m_index].value}; }

            ConstIterator& operator++()
            {
                ++m_index;
                Advance_();
                return *this;
            }

            ConstIterator operator++(int)
            {
                ConstIterator previous = *this;
                ++*this;
                return previous;
            }

            bool operator==(const ConstIterator& other) const { return m_map == other.m_map && m_index == other.m_index; }
            bool operator!=(const ConstIterator& other) const { return !(*this == other); }

        private:
            void Advance_()
            {
                if (!m_map)
                    return;
                while (m_index < m_map->m_size && m_map->m_buckets[m_index].tag <= 0)
                    ++m_index;
            }

            const HashMap* m_map {nullptr};
            UInt32         m_index {0};
        };

        ConstIterator Begin() const { return ConstIterator(this, 0); }
        ConstIterator End() const { return ConstIterator(this, m_size); }
        ConstIterator begin() const { return Begin(); }
        ConstIterator end() const { return End(); }

        /// @brief Read-only view of the keys or values of live entries, in bucket order.
        template<typename T, bool kKeys>
        class ProjectionView
        {
        public:
            class Iterator
            {
            public:
                using difference_type   = std::ptrdiff_t;
                using value_type        = T;
                using reference         = const T&;
                using pointer           = const T*;
                using iterator_category = std::forward_iterator_tag;

                Iterator() = default;
                explicit Iterator(ConstIterator it) : m_it(it) {}

                reference operator*() const
                {
                    if constexpr (kKeys)
                        return (*m_it).key;
                    else
                        return (*m_it).value;
                }

                pointer operator->() const { return &**this; }

                Iterator& operator++()
                {
                    ++m_it;
                    return *this;
                }

                Iterator operator++(int)
                {
                    Iterator previous = *this;
                    ++m_it;
                    return previous;
                }

                bool operator==(const Iterator& other) const { return m_it == other.m_it; }
                bool operator!=(const Iterator& other) const { return !(*this == other); }

            private:
                ConstIterator m_it {};
            };

            explicit ProjectionView(const HashMap& map) noexcept : m_map(&map) {}

            [[nodiscard]] Iterator begin() const { return Iterator(m_map->Begin()); }
            [[nodiscard]] Iterator end() const { return Iterator(m_map->End()); }
            [[nodiscard]] UInt32 Count() const noexcept { return m_map->Count(); }
            [[nodiscard]] bool IsEmpty() const noexcept { return m_map->IsEmpty(); }

        private:
            const HashMap* m_map;
        };

        using KeyView   = ProjectionView<Key, true>;
        using ValueView = ProjectionView<Value, false>;

        /// @brief Keys of live entries. Invalidated by any mutation.
        [[nodiscard]] KeyView Keys() const noexcept { return KeyView(*this); }
        /// @brief Values of live entries. Invalidated by any mutation.
        [[nodiscard]] ValueView Values() const noexcept { return ValueView(*this); }

        /// @brief Single-pass traversal that may remove or replace the entry it is positioned on.
        ///
        /// Visits buckets from the highest index down. Removals through the cursor tombstone the
        /// bucket at once but the table's live count is only reduced when the cursor is reset or
        /// closed. Any other mutation of the table makes every further cursor operation report
        /// `ConcurrentModification`; `Reset()` re-synchronizes.
        class Cursor
        {
        public:
            explicit Cursor(HashMap& map) noexcept
                : m_map(&map), m_position(map.m_size), m_remaining(map.m_count), m_version(map.m_version)
            {
            }

            Cursor(const Cursor&)            = delete;
            Cursor& operator=(const Cursor&) = delete;

            Cursor(Cursor&& other) noexcept
                : m_map(std::exchange(other.m_map, nullptr)),
                  m_position(other.m_position),
                  m_remaining(other.m_remaining),
                  m_version(other.m_version),
                  m_pendingRemoved(std::exchange(other.m_pendingRemoved, 0)),
                  m_hasCurrent(std::exchange(other.m_hasCurrent, false))
            {
            }

            Cursor& operator=(Cursor&& other) noexcept
            {
                if (this == &other)
                    return *this;

                Close();
                m_map            = std::exchange(other.m_map, nullptr);
                m_position       = other.m_position;
                m_remaining      = other.m_remaining;
                m_version        = other.m_version;
                m_pendingRemoved = std::exchange(other.m_pendingRemoved, 0);
                m_hasCurrent     = std::exchange(other.m_hasCurrent, false);
                return *this;
            }

            ~Cursor() { Close(); }

            /// @brief Advances to the next live entry.
            /// @return true when positioned on an entry, false once exhausted.
            [[nodiscard]] MapExpected<bool> MoveNext()
            {
                if (auto status = CheckUsable_(); !status)
                    return std::unexpected(status.error());

                m_hasCurrent = false;
                while (m_remaining > 0 && m_position > 0)
                {
                    --m_position;
                    if (m_map->m_buckets[m_position].tag > 0)
                    {
                        --m_remaining;
                        m_hasCurrent = true;
                        return true;
                    }
                }

                m_remaining = 0;
                return false;
            }

            /// @brief Entry the cursor is positioned on.
            /// @return `InvalidState` without a current entry, `ConcurrentModification` after a foreign mutation.
            [[nodiscard]] MapExpected<KeyValueRef> Current() const noexcept
            {
                if (auto status = CheckCurrent_(); !status)
                    return std::unexpected(status.error());
                auto& bucket = m_map->m_buckets[m_position];
                return KeyValueRef {bucket.key, bucket.value};
            }

            [[nodiscard]] MapExpected<const Key*> CurrentKey() const noexcept
            {
                if (auto status = CheckCurrent_(); !status)
                    return std::unexpected(status.error());
                return &m_map->m_buckets[m_position].key;
            }

            [[nodiscard]] MapExpected<Value*> CurrentValue() const noexcept
            {
                if (auto status = CheckCurrent_(); !status)
                    return std::unexpected(status.error());
                return &m_map->m_buckets[m_position].value;
            }

            /// @brief `kNoSlot` unless `Current()` would succeed.
            [[nodiscard]] SlotIndex CurrentSlot() const noexcept { return CheckCurrent_() ? m_position : kNoSlot; }

            /// @brief Tombstones the current entry. The table's count catches up on `Reset()`/`Close()`.
            MapExpected<void> RemoveCurrent()
            {
                if (auto status = CheckCurrent_(); !status)
                    return status;

                m_map->Bury_(m_position);
                ++m_map->m_deferredRemovals;
                ++m_pendingRemoved;
                m_version    = ++m_map->m_version;
                m_hasCurrent = false;
                return {};
            }

            /// @brief Overwrites the value of the current entry in place.
            template<class V>
                requires std::is_assignable_v<Value&, V&&>
            MapExpected<void> ReplaceCurrentValue(V&& value)
            {
                if (auto status = CheckCurrent_(); !status)
                    return status;

                m_map->m_buckets[m_position].value = std::forward<V>(value);
                m_version                          = ++m_map->m_version;
                return {};
            }

            /// @brief Applies pending removals and restarts the traversal from the current table state.
            MapExpected<void> Reset()
            {
                if (!m_map)
                    return std::unexpected(MakeMapError(MapErrc::InvalidState));

                ApplyPendingRemovals_();
                m_position   = m_map->m_size;
                m_remaining  = m_map->m_count;
                m_version    = m_map->m_version;
                m_hasCurrent = false;
                return {};
            }

            /// @brief Applies pending removals and detaches from the table. Idempotent.
            void Close() noexcept
            {
                if (!m_map)
                    return;
                ApplyPendingRemovals_();
                m_map        = nullptr;
                m_hasCurrent = false;
            }

            [[nodiscard]] bool IsOpen() const noexcept { return m_map != nullptr; }
            [[nodiscard]] UInt32 PendingRemovals() const noexcept { return m_pendingRemoved; }

        private:
            [[nodiscard]] MapExpected<void> CheckUsable_() const noexcept
            {
                if (!m_map)
                    return std::unexpected(MakeMapError(MapErrc::InvalidState));
                if (m_map->m_version != m_version)
                    return std::unexpected(MakeMapError(MapErrc::ConcurrentModification));
                return {};
            }

            [[nodiscard]] MapExpected<void> CheckCurrent_() const noexcept
            {
                if (auto status = CheckUsable_(); !status)
                    return status;
                if (!m_hasCurrent)
                    return std::unexpected(MakeMapError(MapErrc::InvalidState));
                return {};
            }

            void ApplyPendingRemovals_() noexcept
            {
                // Rehash and Clear recount the table and discard the deferred tally.
                const UInt32 applied = std::min(m_pendingRemoved, m_map->m_deferredRemovals);
                m_pendingRemoved     = 0;
                if (applied == 0)
                    return;

                m_map->m_deferredRemovals -= applied;
                if (applied >= m_map->m_count)
                    m_map->Clear();
                else
                    m_map->m_count -= applied;
            }

            HashMap*  m_map {nullptr};
            SlotIndex m_position {0};
            UInt32    m_remaining {0};
            UInt64    m_version {0};
            UInt32    m_pendingRemoved {0};
            bool      m_hasCurrent {false};
        };

        /// @brief Opens a cursor over this table.
        [[nodiscard]] Cursor Iter() noexcept { return Cursor(*this); }

    private:
        struct Bucket
        {
            Key   key {};
            Value value {};
            Int32 tag {0};
        };

        struct Probe
        {
            SlotIndex found {kNoSlot};
            SlotIndex insertAt {kNoSlot};
        };

        void AdoptParams_(const HashMapParams& params)
        {
            if (params.Check())
            {
                m_params = params;
                return;
            }

            detail::ReportInvalidParams(params);
            m_params      = HashMapParams {};
            m_configError = MakeMapError(MapErrc::InvalidConfiguration);
        }

        void Initialize_(UInt32 size)
        {
            m_buckets          = std::make_unique<Bucket[]>(size);
            m_size             = size;
            m_loadLimit        = m_params.CalcLoadLimit(size);
            m_count            = 0;
            m_deferredRemovals = 0;
        }

        void EnsureAllocated_()
        {
            if (!m_buckets)
                Initialize_(m_params.initialSize);
        }

        [[nodiscard]] UInt32 Hash31_(const Key& key) const
        {
            const UInt32 h = Hashing::Fold32(static_cast<UInt64>(m_hash(key))) & 0x7FFFFFFFu;
            return h ? h : kZeroHashTag;
        }

        ORE_ALWAYS_INLINE void CountCollision_() const noexcept
        {
#if ORE_HASHMAP_COUNT_COLLISIONS
            ++m_collisions;
#endif
        }

        [[nodiscard]] static constexpr SlotIndex NextSlot_(SlotIndex idx, UInt32 jump, UInt32 size) noexcept
        {
            idx += jump;
            return idx >= size ? idx - size : idx;
        }

        /// Walks the jump sequence of `key` until it finds the key or an unused bucket,
        /// remembering the first reusable bucket on the way.
        [[nodiscard]] Probe Probe_(const Key& key, UInt32 h) const
        {
            Probe result;
            if (m_size == 0)
                return result;

            SlotIndex    idx  = h % m_size;
            const UInt32 jump = m_params.CalcJump(h, m_size);
            for (UInt32 step = 0; step < m_size; ++step)
            {
                const Bucket& b = m_buckets[idx];
                if (b.tag == 0)
                {
                    if (result.insertAt == kNoSlot)
                        result.insertAt = idx;
                    return result;
                }

                if (b.tag > 0)
                {
                    if (static_cast<UInt32>(b.tag) == h && m_keyEqual(b.key, key))
                    {
                        result.found = idx;
                        return result;
                    }
                }
                else if (result.insertAt == kNoSlot)
                {
                    result.insertAt = idx;
                }

                CountCollision_();
                idx = NextSlot_(idx, jump, m_size);
            }
            return result;
        }

        template<class V>
        MapExpected<SlotIndex> UpdateExisting_(SlotIndex slot, V&& value, bool overwrite)
        {
            if (!overwrite)
                return std::unexpected(MakeMapError(MapErrc::KeyAlreadyMapped, slot));

            m_buckets[slot].value = std::forward<V>(value);
            ++m_version;
            return slot;
        }

        template<class K, class V>
        MapExpected<SlotIndex> InsertImpl_(K&& key, V&& value, bool overwrite)
        {
            EnsureAllocated_();

            const UInt32 h = Hash31_(key);

            if (m_count >= m_loadLimit)
            {
                const Probe existing = Probe_(key, h);
                if (existing.found != kNoSlot)
                    return UpdateExisting_(existing.found, std::forward<V>(value), overwrite);

                while (m_count >= m_loadLimit)
                {
                    if (!Grow_())
                        return std::unexpected(MakeMapError(MapErrc::CapacityExceeded));
                }
            }

            const Probe probe = Probe_(key, h);
            if (probe.found != kNoSlot)
                return UpdateExisting_(probe.found, std::forward<V>(value), overwrite);
            if (probe.insertAt == kNoSlot)
                return std::unexpected(MakeMapError(MapErrc::CapacityExceeded));

            Bucket& b = m_buckets[probe.insertAt];
            b.key     = std::forward<K>(key);
            b.value   = std::forward<V>(value);
            b.tag     = static_cast<Int32>(h);

            ++m_count;
            ++m_version;
            return probe.insertAt;
        }

        /// Turns a live bucket into a tombstone. The key stays for probe-chain continuity.
        void Bury_(SlotIndex slot)
        {
            Bucket& b = m_buckets[slot];
            b.value   = Value {};
            b.tag     = -b.tag;
        }

        bool Grow_()
        {
            const UInt32 next = m_params.CalcNextSize(m_size);
            if (next <= m_size)
                return false;
            Rehash_(next);
            return true;
        }

        /// Rebuilds into `newSize` buckets, replaying live entries along their jump sequences.
        void Rehash_(UInt32 newSize)
        {
            auto   fresh = std::make_unique<Bucket[]>(newSize);
            UInt32 live  = 0;

            for (UInt32 i = 0; i < m_size; ++i)
            {
                Bucket& old = m_buckets[i];
                if (old.tag <= 0)
                    continue;

                const auto   h    = static_cast<UInt32>(old.tag);
                SlotIndex    idx  = h % newSize;
                const UInt32 jump = m_params.CalcJump(h, newSize);
                while (fresh[idx].tag != 0)
                {
                    CountCollision_();
                    idx = NextSlot_(idx, jump, newSize);
                }

                Bucket& dst = fresh[idx];
                dst.key     = std::move(old.key);
                dst.value   = std::move(old.value);
                dst.tag     = old.tag;
                ++live;
            }

            m_buckets          = std::move(fresh);
            m_size             = newSize;
            m_loadLimit        = m_params.CalcLoadLimit(newSize);
            m_count            = live;
            m_deferredRemovals = 0;
            ++m_version;
        }

        HashMapParams m_params {};

        [[no_unique_address]] Hash       m_hash {};
        [[no_unique_address]] KeyEqual   m_keyEqual {};
        [[no_unique_address]] ValueEqual m_valueEqual {};

        std::unique_ptr<Bucket[]> m_buckets {};
        UInt32                    m_size {0};
        UInt32                    m_loadLimit {0};
        UInt32                    m_count {0};
        UInt32                    m_deferredRemovals {0};
        mutable UInt32            m_collisions {0};
        UInt64                    m_version {0};
        MapError                  m_configError {};
    };
}// namespace ORE::Containers
