#pragma once

#include <ident-core/allocation.hh>
#include <ident-core/assert.hh>
#include <ident-core/completion_signal.hh>
#include <ident-core/fwd.hh>
#include <ident-core/optional.hh>
#include <ident-core/pair.hh>
#include <ident-core/span.hh>
#include <ident-core/utility.hh>

#include <compare>
#include <concepts>
#include <iterator>
#include <type_traits>

/// Sorted associative container over two parallel contiguous buffers (keys and values).
///
/// Entries are kept in strictly ascending key order (by K's operator<=>), so lookup is a
/// binary search and iteration is ordered. Insertion and removal shift the tail of both
/// buffers with one memmove each. Growth doubles the capacity.
///
/// Storage comes from an ic::memory_resource chosen at creation (default: system resource).
/// Storage is released by dispose(), by dispose_after(signal) once the signal completes,
/// or by the destructor, whichever comes first.
///
/// Usage:
///   auto map = ic::flat_map<ic::snowflake_id, float>::create();
///   map.insert(id, 1.5f);                 // no-op if id is already present
///   map.set(id, 2.5f);                    // insert or overwrite
///   if (auto v = map.try_get(id); v.has_value())
///       use(v.value());
///   for (auto [key, value] : map)         // ascending key order
///       ...
///   map.dispose();
///
/// Restrictions:
/// - K and V must be trivially copyable (entries are relocated with memmove)
/// - K must be three-way comparable and the ordering must be a total order
/// - no internal synchronization; concurrent readers are fine while nobody writes
/// - keys(), values(), and iterators are invalidated by any structural mutation
///
/// Invariants:
/// - keys()[i - 1] < keys()[i] for all 0 < i < size()
/// - both buffers have the same capacity and the same live size
/// - slots at index >= size() are never read
template <class K, class V>
struct ic::flat_map
{
    static_assert(std::is_trivially_copyable_v<K> && std::is_trivially_destructible_v<K>,
                  "flat_map keys must be trivially copyable");
    static_assert(std::is_trivially_copyable_v<V> && std::is_trivially_destructible_v<V>,
                  "flat_map values must be trivially copyable");
    static_assert(std::three_way_comparable<K>, "flat_map keys must support operator<=>");

    using key_t = K;
    using value_t = V;
    using entry_t = pair<K, V>;

    /// Capacity of create() without a hint
    static constexpr isize default_capacity = 64;

    struct iterator;

    // construction
public:
    /// Empty map without storage, allocates from the default resource on first insertion
    flat_map() = default;

    /// Empty map with room for max(capacity_hint, 1) entries
    /// resource == nullptr selects the default memory resource
    [[nodiscard]] static flat_map create(isize capacity_hint = default_capacity, memory_resource const* resource = nullptr)
    {
        auto const capacity = ic::max(capacity_hint, isize(1));

        flat_map m;
        m._keys = allocation<K>::create_empty(capacity, alignof(K), resource);
        m._values = allocation<V>::create_empty(capacity, alignof(V), resource);
        return m;
    }

    // lookup
public:
    /// Index of the entry with an equal key, or ~insertion_index (always negative) if there is none.
    /// The insertion index is where `key` would have to go to keep the keys sorted.
    /// Usage:
    ///   auto const r = map.binary_search(key);
    ///   if (map.is_found(r)) ... map.values()[r] ...
    ///   else                 ... map.insertion_index_of(r) ...
    [[nodiscard]] isize binary_search(K const& key) const
    {
        check_alive();

        K const* const keys = _keys.obj_start;
        isize lo = 0;
        isize hi = size() - 1;

        while (lo <= hi)
        {
            isize const mid = lo + (hi - lo) / 2;
            auto const c = keys[mid] <=> key;

            if (c == 0)
                return mid;

            if (c < 0)
                lo = mid + 1;
            else
                hi = mid - 1;
        }

        return ~lo;
    }

    [[nodiscard]] static constexpr bool is_found(isize search_result) { return search_result >= 0; }

    /// Decodes the insertion index from a negative binary_search result
    [[nodiscard]] static constexpr isize insertion_index_of(isize search_result)
    {
        IC_ASSERT(search_result < 0, "search result is a hit, not an insertion point");
        return ~search_result;
    }

    [[nodiscard]] bool contains_key(K const& key) const { return is_found(binary_search(key)); }

    /// True iff `key` is present and its value compares equal to `value`
    [[nodiscard]] bool contains(K const& key, V const& value) const
        requires std::equality_comparable<V>
    {
        auto const r = binary_search(key);
        return is_found(r) && _values.obj_start[r] == value;
    }

    /// The value stored for `key`, or an empty optional if the key is absent
    [[nodiscard]] optional<V> try_get(K const& key) const
    {
        auto const r = binary_search(key);
        if (!is_found(r))
            return {};
        return optional<V>(_values.obj_start[r]);
    }

    /// The value stored for `key`
    /// Reading a missing key is a programming error and fails in every build configuration.
    /// Use try_get or get_or when absence is expected.
    [[nodiscard]] V const& get(K const& key) const
    {
        auto const r = binary_search(key);
        IC_ASSERT_ALWAYS(is_found(r), "flat_map::get: key not found");
        return _values.obj_start[r];
    }

    /// The value stored for `key`, or `fallback` if the key is absent
    [[nodiscard]] V get_or(K const& key, V const& fallback) const
    {
        auto const r = binary_search(key);
        return is_found(r) ? _values.obj_start[r] : fallback;
    }

    // mutation
public:
    /// Adds (key, value) if the key is not present yet.
    /// Returns false and leaves the map untouched if the key already exists.
    bool insert(K const& key, V const& value)
    {
        auto const r = binary_search(key);
        if (is_found(r))
            return false;

        insert_at(~r, key, value);
        return true;
    }

    /// Overwrites the value of an existing key or inserts a new entry
    void set(K const& key, V const& value)
    {
        auto const r = binary_search(key);
        if (is_found(r))
            _values.obj_start[r] = value;
        else
            insert_at(~r, key, value);
    }

    /// Removes the entry with this key, returns false if there was none
    /// Never shrinks the capacity.
    bool remove(K const& key)
    {
        auto const r = binary_search(key);
        if (!is_found(r))
            return false;

        remove_at(r);
        return true;
    }

    /// Removes the entry only if the key is present and its value equals `value`
    bool remove(K const& key, V const& value)
        requires std::equality_comparable<V>
    {
        auto const r = binary_search(key);
        if (!is_found(r) || !(_values.obj_start[r] == value))
            return false;

        remove_at(r);
        return true;
    }

    /// Removes all entries, keeps the capacity
    void clear()
    {
        check_alive();
        _keys.obj_end = _keys.obj_start;
        _values.obj_end = _values.obj_start;
    }

    // capacity
public:
    [[nodiscard]] isize size() const
    {
        check_alive();
        return _keys.obj_size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }

    [[nodiscard]] isize capacity() const
    {
        check_alive();
        return _keys.obj_capacity();
    }

    /// Grows the storage to hold at least `min_capacity` entries without reallocating
    void reserve(isize min_capacity)
    {
        check_alive();
        if (min_capacity > capacity())
            realloc_buffers(min_capacity);
    }

    /// Shrinks the storage to exactly size() entries, releases it completely if the map is empty
    void shrink_to_fit()
    {
        check_alive();

        if (empty())
        {
            release_buffers();
            return;
        }

        if (capacity() > size())
            realloc_buffers(size());
    }

    /// The resource this map allocates from
    [[nodiscard]] memory_resource const* resource() const { return &_keys.resource(); }

    // bulk access
public:
    /// The keys in ascending order
    [[nodiscard]] span<K const> keys() const
    {
        check_alive();
        return span<K const>(_keys.obj_start, _keys.obj_end);
    }

    /// The values, index-aligned with keys()
    [[nodiscard]] span<V const> values() const
    {
        check_alive();
        return span<V const>(_values.obj_start, _values.obj_end);
    }

    /// Copies all entries in key order to dest[dest_index], dest[dest_index + 1], ...
    void copy_to(span<entry_t> dest, isize dest_index) const
    {
        check_alive();
        IC_ASSERT(0 <= dest_index && dest_index <= dest.size(), "copy_to: destination index out of range");
        IC_ASSERT(dest.size() - dest_index >= size(), "copy_to: destination too small");

        auto const n = size();
        for (isize i = 0; i < n; ++i)
            dest[dest_index + i] = entry_t{_keys.obj_start[i], _values.obj_start[i]};
    }

    // iteration
public:
    /// Read-only iteration in ascending key order, entries are yielded as pair<K, V> by value
    /// Models std::forward_iterator, so std::distance and std::ranges algorithms work on the map.
    /// Dereferencing yields a prvalue, hence the legacy category is only input_iterator_tag.
    struct iterator
    {
        using iterator_concept = std::forward_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = entry_t;
        using difference_type = isize;
        using reference = entry_t;
        using pointer = void;

        K const* key = nullptr;
        V const* value = nullptr;

        [[nodiscard]] entry_t operator*() const { return entry_t{*key, *value}; }

        iterator& operator++()
        {
            ++key;
            ++value;
            return *this;
        }

        iterator operator++(int)
        {
            auto const prev = *this;
            ++*this;
            return prev;
        }

        [[nodiscard]] bool operator==(iterator const& rhs) const { return key == rhs.key; }
    };

    [[nodiscard]] iterator begin() const
    {
        check_alive();
        return iterator{_keys.obj_start, _values.obj_start};
    }
    [[nodiscard]] iterator end() const
    {
        check_alive();
        return iterator{_keys.obj_end, _values.obj_end};
    }

    // disposal
public:
    /// Releases the storage now. The map must not be used afterwards
    /// (only destruction and move-assignment are allowed).
    void dispose()
    {
        IC_ASSERT(!_disposed, "flat_map disposed twice");
        release_buffers();
        _disposed = true;
    }

    /// Disposes the map now but releases its storage only once `prior` completes.
    /// Returns a signal that completes after the storage was released.
    /// If `prior` is already complete, the storage is released before this returns.
    completion_signal dispose_after(completion_signal const& prior)
    {
        IC_ASSERT(!_disposed, "flat_map disposed twice");

        _disposed = true;
        return prior.then(
            [keys = ic::move(_keys), values = ic::move(_values)]() mutable
            {
                keys = allocation<K>();
                values = allocation<V>();
            });
    }

    [[nodiscard]] bool is_disposed() const { return _disposed; }

    // lifecycle
public:
    /// Deep copy into a tight allocation from the same resource as rhs
    flat_map(flat_map const& rhs)
      : _keys(allocation<K>::create_copy_of(rhs.keys(), rhs.size(), rhs._keys.custom_resource)),
        _values(allocation<V>::create_copy_of(rhs.values(), rhs.size(), rhs._values.custom_resource))
    {
    }

    /// Deep copy that keeps the resource of this map
    flat_map& operator=(flat_map const& rhs)
    {
        check_alive();
        if (this != &rhs)
        {
            _keys = allocation<K>::create_copy_of(rhs.keys(), rhs.size(), _keys.custom_resource);
            _values = allocation<V>::create_copy_of(rhs.values(), rhs.size(), _values.custom_resource);
        }
        return *this;
    }

    /// Takes over the storage, rhs is left empty (and not disposed)
    flat_map(flat_map&& rhs) noexcept
      : _keys(ic::move(rhs._keys)), _values(ic::move(rhs._values)), _disposed(ic::exchange(rhs._disposed, false))
    {
    }

    flat_map& operator=(flat_map&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _keys = ic::move(rhs._keys);
            _values = ic::move(rhs._values);
            _disposed = ic::exchange(rhs._disposed, false);
        }
        return *this;
    }

    ~flat_map() = default;

private:
    void check_alive() const { IC_ASSERT(!_disposed, "flat_map used after dispose"); }

    void insert_at(isize idx, K const& key, V const& value)
    {
        if (size() == capacity())
            grow();

        // offsets are computed after growth, the buffers may have moved
        auto const n = size();
        K* const keys = _keys.obj_start;
        V* const values = _values.obj_start;

        ic::memmove(keys + idx + 1, keys + idx, (n - idx) * isize(sizeof(K)));
        ic::memmove(values + idx + 1, values + idx, (n - idx) * isize(sizeof(V)));

        new (ic::placement_new, keys + idx) K(key);
        new (ic::placement_new, values + idx) V(value);

        ++_keys.obj_end;
        ++_values.obj_end;
    }

    void remove_at(isize idx)
    {
        auto const n = size();
        K* const keys = _keys.obj_start;
        V* const values = _values.obj_start;

        ic::memmove(keys + idx, keys + idx + 1, (n - idx - 1) * isize(sizeof(K)));
        ic::memmove(values + idx, values + idx + 1, (n - idx - 1) * isize(sizeof(V)));

        --_keys.obj_end;
        --_values.obj_end;
    }

    IC_COLD_FUNC void grow()
    {
        auto const old_capacity = capacity();
        realloc_buffers(ic::max(old_capacity * 2, old_capacity + 1));
    }

    // both buffers get exactly new_capacity entries
    void realloc_buffers(isize new_capacity)
    {
        IC_ASSERT(new_capacity >= size(), "cannot shrink below the live entries");

        auto const key_bytes = new_capacity * isize(sizeof(K));
        auto const value_bytes = new_capacity * isize(sizeof(V));
        _keys.resize_alloc(key_bytes, key_bytes, alignof(K));
        _values.resize_alloc(value_bytes, value_bytes, alignof(V));
    }

    // returns both buffers to the resource, keeps the resource for later growth
    void release_buffers()
    {
        auto* const resource = _keys.custom_resource;
        _keys = allocation<K>::create_empty(0, alignof(K), resource);
        _values = allocation<V>::create_empty(0, alignof(V), resource);
    }

private:
    allocation<K> _keys;
    allocation<V> _values;
    bool _disposed = false;
};
