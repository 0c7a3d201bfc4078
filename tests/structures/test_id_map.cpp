// idmap_structures IdMap tests

#include <catch2/catch.hpp>
#include <idmap/structures/structures.hpp>
#include <idmap/core/error.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using namespace idmap_structures;

namespace {

/// Counts live instances to check every value is destroyed exactly once
struct Tracked {
    static inline int live = 0;

    int value;

    explicit Tracked(int v) : value(v) { ++live; }
    Tracked(const Tracked& other) : value(other.value) { ++live; }
    Tracked(Tracked&& other) noexcept : value(other.value) { ++live; }
    Tracked& operator=(const Tracked&) = default;
    Tracked& operator=(Tracked&&) noexcept = default;
    ~Tracked() { --live; }

    bool operator==(const Tracked& other) const { return value == other.value; }
};

std::ostream& operator<<(std::ostream& os, const Tracked& t) {
    return os << t.value;
}

/// Copyable value whose move may throw, so relocation copies it; copies
/// fail once the budget runs out
struct Fragile {
    static inline int live = 0;
    static inline int copy_budget = -1;  // Negative: unlimited

    int value;

    explicit Fragile(int v) : value(v) { ++live; }

    Fragile(const Fragile& other) : value(other.value) {
        if (copy_budget == 0) {
            throw std::runtime_error("copy budget exhausted");
        }
        if (copy_budget > 0) {
            --copy_budget;
        }
        ++live;
    }

    Fragile(Fragile&& other) : value(other.value) { ++live; }
    Fragile& operator=(const Fragile&) = default;
    ~Fragile() { --live; }
};

/// Counts copies and moves made while storing a value
struct MoveCounted {
    static inline int moves = 0;
    static inline int copies = 0;

    std::string text;

    MoveCounted(std::size_t n, char c) : text(n, c) {}
    MoveCounted(const MoveCounted& other) : text(other.text) { ++copies; }
    MoveCounted(MoveCounted&& other) noexcept : text(std::move(other.text)) { ++moves; }
};

template<typename T>
void check_invariants(const IdMap<T>& map) {
    const BitSet& ids = map.occupancy();
    const std::size_t cursor = map.next_id().value;

    for (std::size_t i = 0; i < cursor; ++i) {
        REQUIRE(ids.contains(i));
    }
    REQUIRE_FALSE(ids.contains(cursor));

    for (std::size_t id : ids) {
        REQUIRE(id < map.storage_bound());
    }
    REQUIRE(map.storage_bound() <= map.capacity());
    REQUIRE(map.size() == ids.len());
}

template<typename T>
std::vector<T> collect_values(const IdMap<T>& map) {
    std::vector<T> out;
    for (const T& v : map.values()) {
        out.push_back(v);
    }
    return out;
}

template<typename T>
std::string render(const IdMap<T>& map) {
    std::ostringstream oss;
    oss << map;
    return oss.str();
}

} // anonymous namespace

// =============================================================================
// Id Tests
// =============================================================================

TEST_CASE("Id basics", "[structures][id]") {
    SECTION("default is zero") {
        Id id;
        REQUIRE(id.get() == 0);
    }

    SECTION("comparison") {
        REQUIRE(Id(1) == Id(1));
        REQUIRE(Id(1) != Id(2));
        REQUIRE(Id(1) < Id(2));
        REQUIRE(Id(3) >= Id(2));
    }

    SECTION("hashing") {
        std::unordered_set<Id> set;
        set.insert(Id(4));
        REQUIRE(set.count(Id(4)) == 1);
        REQUIRE(set.count(Id(5)) == 0);
    }

    SECTION("streaming") {
        std::ostringstream oss;
        oss << Id(42);
        REQUIRE(oss.str() == "42");
    }
}

// =============================================================================
// Construction Tests
// =============================================================================

TEST_CASE("IdMap construction", "[structures][idmap]") {
    SECTION("default empty") {
        IdMap<int> map;
        REQUIRE(map.empty());
        REQUIRE(map.is_empty());
        REQUIRE(map.size() == 0);
        REQUIRE(map.next_id() == Id(0));
        REQUIRE(map.storage_bound() == 0);
        check_invariants(map);
    }

    SECTION("with capacity") {
        IdMap<std::string> map(100);
        REQUIRE(map.empty());
        REQUIRE(map.capacity() >= 100);
        REQUIRE(map.occupancy().capacity() >= 100);
    }

    SECTION("from initializer list") {
        IdMap<int> map{10, 20, 30};
        REQUIRE(map.len() == 3);
        REQUIRE(map[Id(0)] == 10);
        REQUIRE(map[Id(2)] == 30);
        REQUIRE(map.next_id() == Id(3));
        check_invariants(map);
    }

    SECTION("from range") {
        std::vector<std::string> words{"a", "b"};
        IdMap<std::string> map(words.begin(), words.end());
        REQUIRE(map.len() == 2);
        REQUIRE(map[Id(1)] == "b");
        REQUIRE(map.next_id() == Id(2));
    }

    SECTION("from configuration") {
        idmap_core::Config config;
        config.initial_capacity = 32;
        auto map = make_id_map<int>(config);
        REQUIRE(map.empty());
        REQUIRE(map.capacity() >= 32);
    }
}

// =============================================================================
// Insertion Tests
// =============================================================================

TEST_CASE("IdMap insert and get", "[structures][idmap]") {
    IdMap<int> map;

    SECTION("single insert") {
        Id id = map.insert(42);
        REQUIRE(id == Id(0));
        REQUIRE(map.contains(id));
        REQUIRE(*map.get(id) == 42);
        REQUIRE(map.size() == 1);
        check_invariants(map);
    }

    SECTION("sequential ids") {
        for (int i = 0; i < 100; ++i) {
            REQUIRE(map.insert(i * 10) == Id(static_cast<std::size_t>(i)));
            check_invariants(map);
        }
        for (int i = 0; i < 100; ++i) {
            REQUIRE(map[Id(static_cast<std::size_t>(i))] == i * 10);
        }
    }

    SECTION("get on free id") {
        REQUIRE(map.get(Id(0)) == nullptr);
        map.insert(1);
        REQUIRE(map.get(Id(1)) == nullptr);
        REQUIRE(map.get(Id(1000)) == nullptr);
        REQUIRE_FALSE(map.contains(Id(1000)));
    }

    SECTION("mutable get") {
        Id id = map.insert(1);
        *map.get(id) = 5;
        map[id] += 1;
        REQUIRE(map.at(id) == 6);
    }

    SECTION("const get") {
        Id id = map.insert(7);
        const IdMap<int>& view = map;
        REQUIRE(*view.get(id) == 7);
        REQUIRE(view[id] == 7);
        REQUIRE(view.get(Id(9)) == nullptr);
    }
}

TEST_CASE("IdMap emplace", "[structures][idmap]") {
    SECTION("forwards constructor arguments") {
        IdMap<std::string> map;
        Id id = map.emplace(3, 'x');
        REQUIRE(map[id] == "xxx");
    }

    SECTION("constructs in the slot") {
        IdMap<MoveCounted> map(8);
        MoveCounted::moves = 0;
        MoveCounted::copies = 0;

        Id first = map.emplace(2, 'a');
        Id second = map.emplace(3, 'b');

        REQUIRE(first == Id(0));
        REQUIRE(second == Id(1));
        REQUIRE(map[second].text == "bbb");
        REQUIRE(MoveCounted::moves == 0);
        REQUIRE(MoveCounted::copies == 0);
    }

    SECTION("uses the smallest free id") {
        IdMap<std::string> map{"a", "b", "c"};
        map.remove(Id(1));
        REQUIRE(map.emplace(2, 'z') == Id(1));
        REQUIRE(map.next_id() == Id(3));
        check_invariants(map);
    }
}

TEST_CASE("IdMap insert_at", "[structures][idmap]") {
    IdMap<std::string> map;

    SECTION("free id returns nothing") {
        REQUIRE_FALSE(map.insert_at(Id(0), "a").has_value());
        REQUIRE(map[Id(0)] == "a");
        check_invariants(map);
    }

    SECTION("occupied id returns previous value") {
        map.insert("old");
        auto previous = map.insert_at(Id(0), "new");
        REQUIRE(previous.has_value());
        REQUIRE(*previous == "old");
        REQUIRE(map[Id(0)] == "new");
        REQUIRE(map.size() == 1);
        check_invariants(map);
    }

    SECTION("past the storage bound") {
        map.insert_at(Id(40), "far");
        REQUIRE(map.storage_bound() == 41);
        REQUIRE(map.capacity() >= 41);
        REQUIRE(map.size() == 1);
        REQUIRE(map.next_id() == Id(0));
        check_invariants(map);
    }
}

TEST_CASE("IdMap get_or_insert", "[structures][idmap]") {
    IdMap<int> map;

    SECTION("inserts when free") {
        int& v = map.get_or_insert(Id(2), 9);
        REQUIRE(v == 9);
        REQUIRE(map.contains(Id(2)));
        check_invariants(map);
    }

    SECTION("keeps existing value") {
        map.insert(1);
        int& v = map.get_or_insert(Id(0), 9);
        REQUIRE(v == 1);
        v = 3;
        REQUIRE(map[Id(0)] == 3);
    }

    SECTION("producer only runs when free") {
        int calls = 0;
        auto producer = [&calls] { ++calls; return 77; };

        REQUIRE(map.get_or_insert_with(Id(0), producer) == 77);
        REQUIRE(map.get_or_insert_with(Id(0), producer) == 77);
        REQUIRE(calls == 1);
        check_invariants(map);
    }
}

TEST_CASE("IdMap extend", "[structures][idmap]") {
    IdMap<int> map{1};
    map.remove(Id(0));

    std::vector<int> more{5, 6};
    map.extend(more.begin(), more.end());
    map.extend({7});

    REQUIRE(map[Id(0)] == 5);
    REQUIRE(map[Id(1)] == 6);
    REQUIRE(map[Id(2)] == 7);
    check_invariants(map);
}

// =============================================================================
// Removal Tests
// =============================================================================

TEST_CASE("IdMap remove", "[structures][idmap]") {
    IdMap<std::string> map{"a", "b", "c"};

    SECTION("returns value") {
        auto removed = map.remove(Id(1));
        REQUIRE(removed.has_value());
        REQUIRE(*removed == "b");
        REQUIRE_FALSE(map.contains(Id(1)));
        REQUIRE(map.size() == 2);
        check_invariants(map);
    }

    SECTION("free id is a no-op") {
        map.remove(Id(1));
        REQUIRE_FALSE(map.remove(Id(1)).has_value());
        REQUIRE_FALSE(map.remove(Id(99)).has_value());
        REQUIRE(map.size() == 2);
        check_invariants(map);
    }

    SECTION("erase") {
        REQUIRE(map.erase(Id(0)));
        REQUIRE_FALSE(map.erase(Id(0)));
        REQUIRE(map.size() == 2);
        check_invariants(map);
    }
}

TEST_CASE("IdMap remove_set", "[structures][idmap]") {
    IdMap<int> map{0, 1, 2, 3, 4};

    SECTION("removes the intersection") {
        BitSet doomed{1, 3, 50};
        REQUIRE(map.remove_set(doomed) == 2);
        REQUIRE(collect_values(map) == std::vector<int>{0, 2, 4});
        REQUIRE(map.next_id() == Id(1));
        check_invariants(map);
    }

    SECTION("disjoint set") {
        REQUIRE(map.remove_set(BitSet{7, 8}) == 0);
        REQUIRE(map.size() == 5);
        REQUIRE(map.next_id() == Id(5));
    }

    SECTION("empty set") {
        REQUIRE(map.remove_set(BitSet{}) == 0);
        check_invariants(map);
    }
}

TEST_CASE("IdMap retain", "[structures][idmap]") {
    IdMap<int> map{5, 6, 7, 8};

    SECTION("predicate sees id and value") {
        map.retain([](Id id, int& v) { return id.value != 1 && v != 8; });
        REQUIRE(collect_values(map) == std::vector<int>{5, 7});
        REQUIRE(map.next_id() == Id(1));
        check_invariants(map);
    }

    SECTION("predicate may mutate kept values") {
        map.retain([](Id, int& v) { v *= 2; return true; });
        REQUIRE(collect_values(map) == std::vector<int>{10, 12, 14, 16});
    }

    SECTION("throwing predicate keeps removals made so far") {
        auto pred = [](Id id, int&) -> bool {
            if (id.value == 2) {
                throw std::runtime_error("stop");
            }
            return false;
        };
        REQUIRE_THROWS_AS(map.retain(pred), std::runtime_error);
        REQUIRE(map.size() == 2);
        REQUIRE(map.contains(Id(2)));
        REQUIRE(map.contains(Id(3)));
        check_invariants(map);
    }
}

TEST_CASE("IdMap clear", "[structures][idmap]") {
    IdMap<int> map{1, 2, 3};
    const auto capacity = map.capacity();

    map.clear();

    REQUIRE(map.empty());
    REQUIRE(map.capacity() == capacity);
    REQUIRE(map.storage_bound() == 0);
    REQUIRE(map.next_id() == Id(0));
    REQUIRE(map.insert(4) == Id(0));
    check_invariants(map);
}

// =============================================================================
// Capacity Tests
// =============================================================================

TEST_CASE("IdMap reserve and shrink", "[structures][idmap]") {
    SECTION("reserve") {
        IdMap<int> map{1, 2};
        map.reserve(50);
        REQUIRE(map.capacity() >= 52);
        REQUIRE(map[Id(1)] == 2);
    }

    SECTION("shrink_to_fit compacts to last occupied") {
        IdMap<int> map;
        for (int i = 0; i < 10; ++i) {
            map.insert(i);
        }
        for (std::size_t i = 5; i < 10; ++i) {
            map.remove(Id(i));
        }
        REQUIRE(map.storage_bound() == 10);

        map.shrink_to_fit();

        REQUIRE(map.storage_bound() == 5);
        REQUIRE(map.capacity() == 5);
        REQUIRE(collect_values(map) == std::vector<int>{0, 1, 2, 3, 4});
        check_invariants(map);
    }

    SECTION("shrink_to_fit on empty map releases storage") {
        IdMap<int> map{1};
        map.remove(Id(0));
        map.shrink_to_fit();
        REQUIRE(map.capacity() == 0);
        REQUIRE(map.storage_bound() == 0);
        REQUIRE(map.insert(3) == Id(0));
    }
}

TEST_CASE("IdMap growth failure leaves the map unchanged", "[structures][idmap][lifetime]") {
    Fragile::live = 0;
    Fragile::copy_budget = -1;
    {
        IdMap<Fragile> map;
        for (int i = 0; i < 4; ++i) {
            map.emplace(i);
        }
        const auto capacity = map.capacity();
        REQUIRE(map.size() == capacity);
        REQUIRE(Fragile::live == 4);

        // Relocation copies; the third copy throws midway
        Fragile::copy_budget = 2;
        REQUIRE_THROWS_AS(map.emplace(4), std::runtime_error);
        Fragile::copy_budget = -1;

        REQUIRE(map.size() == 4);
        REQUIRE(map.next_id() == Id(4));
        REQUIRE(map.capacity() == capacity);
        REQUIRE(map.storage_bound() == 4);
        REQUIRE(Fragile::live == 4);
        for (std::size_t i = 0; i < 4; ++i) {
            REQUIRE(map[Id(i)].value == static_cast<int>(i));
        }
        check_invariants(map);

        REQUIRE(map.emplace(4) == Id(4));
        REQUIRE(Fragile::live == 5);
    }
    REQUIRE(Fragile::live == 0);
}

// =============================================================================
// Checked Access Tests
// =============================================================================

TEST_CASE("IdMap checked access on free id", "[structures][idmap]") {
    IdMap<int> map{1};
    map.remove(Id(0));

    SECTION("index operator throws") {
        REQUIRE_THROWS_AS(map[Id(0)], std::out_of_range);
    }

    SECTION("message names the id") {
        REQUIRE_THROWS_WITH(map.at(Id(7)), "id 7 out of bounds");
    }

    SECTION("const access throws") {
        const IdMap<int>& view = map;
        REQUIRE_THROWS_AS(view[Id(3)], std::out_of_range);
    }

    SECTION("failure is recorded") {
        idmap_core::debug::reset_error_stats();
        REQUIRE_THROWS(map.at(Id(0)));
        REQUIRE(idmap_core::debug::id_error_count() == 1);
    }
}

// =============================================================================
// Copy, Move and Swap Tests
// =============================================================================

TEST_CASE("IdMap copy", "[structures][idmap]") {
    IdMap<std::string> original{"a", "b", "c"};
    original.remove(Id(1));

    SECTION("copy is equal and independent") {
        IdMap<std::string> copy(original);
        REQUIRE(copy == original);
        REQUIRE(copy.next_id() == Id(1));
        REQUIRE(copy.capacity() == original.storage_bound());
        check_invariants(copy);

        copy[Id(0)] = "z";
        REQUIRE(original[Id(0)] == "a");
        REQUIRE(copy != original);
    }

    SECTION("copy assignment replaces contents") {
        IdMap<std::string> target{"x", "y", "z", "w"};
        target = original;
        REQUIRE(target == original);
        REQUIRE(target.size() == 2);
        check_invariants(target);
    }
}

TEST_CASE("IdMap move and swap", "[structures][idmap]") {
    IdMap<int> a{1, 2, 3};

    SECTION("move construction leaves source empty") {
        IdMap<int> b(std::move(a));
        REQUIRE(b.size() == 3);
        REQUIRE(a.empty());
        REQUIRE(a.next_id() == Id(0));
        REQUIRE(a.insert(9) == Id(0));
        check_invariants(b);
    }

    SECTION("move assignment") {
        IdMap<int> b{7};
        b = std::move(a);
        REQUIRE(b.size() == 3);
        REQUIRE(b[Id(2)] == 3);
    }

    SECTION("swap") {
        IdMap<int> b{9};
        swap(a, b);
        REQUIRE(a.size() == 1);
        REQUIRE(b.size() == 3);
        REQUIRE(a[Id(0)] == 9);
    }
}

TEST_CASE("IdMap with move-only values", "[structures][idmap]") {
    IdMap<std::unique_ptr<int>> map;
    for (int i = 0; i < 20; ++i) {
        map.insert(std::make_unique<int>(i));
    }

    auto removed = map.remove(Id(3));
    REQUIRE(removed.has_value());
    REQUIRE(**removed == 3);
    REQUIRE(*map[Id(19)] == 19);
    REQUIRE(map.insert(std::make_unique<int>(100)) == Id(3));
}

// =============================================================================
// Equality and Formatting Tests
// =============================================================================

TEST_CASE("IdMap equality", "[structures][idmap]") {
    SECTION("same ids and values") {
        IdMap<int> a{1, 2, 3};
        IdMap<int> b;
        b.insert_at(Id(2), 3);
        b.insert_at(Id(0), 1);
        b.insert_at(Id(1), 2);
        REQUIRE(a == b);
    }

    SECTION("different value") {
        REQUIRE(IdMap<int>{1, 2} != IdMap<int>{1, 3});
    }

    SECTION("same values under different ids") {
        IdMap<int> a{1, 2};
        IdMap<int> b{1, 0, 2};
        b.remove(Id(1));
        REQUIRE(a != b);
    }

    SECTION("capacity is ignored") {
        IdMap<int> a{1};
        IdMap<int> b(64);
        b.insert(1);
        REQUIRE(a == b);
    }
}

TEST_CASE("IdMap formatting", "[structures][idmap]") {
    SECTION("empty") {
        REQUIRE(render(IdMap<int>{}) == "{}");
    }

    SECTION("numbers") {
        IdMap<int> map{0, 1, 2};
        map.remove(Id(1));
        REQUIRE(render(map) == "{0: 0, 2: 2}");
    }

    SECTION("booleans print as words") {
        IdMap<bool> map{true, false};
        REQUIRE(render(map) == "{0: true, 1: false}");
    }

    SECTION("strings are quoted") {
        IdMap<std::string> map{"blue", "red"};
        REQUIRE(render(map) == "{0: \"blue\", 1: \"red\"}");
    }
}

// =============================================================================
// Scenario Tests
// =============================================================================

TEST_CASE("IdMap basic churn", "[structures][idmap][scenario]") {
    IdMap<std::string> map;
    REQUIRE(map.insert("blue") == Id(0));
    REQUIRE(map.insert("red") == Id(1));
    REQUIRE(map.insert("green") == Id(2));

    map.remove(Id(1));
    REQUIRE(map.insert("yellow") == Id(1));

    REQUIRE(render(map) == "{0: \"blue\", 1: \"yellow\", 2: \"green\"}");
    check_invariants(map);
}

TEST_CASE("IdMap bulk removal", "[structures][idmap][scenario]") {
    IdMap<int> map;
    for (int i = 0; i < 100; ++i) {
        map.insert(i);
    }

    BitSet doomed;
    for (std::size_t i = 0; i < 50; ++i) {
        doomed.insert(i);
    }
    REQUIRE(map.remove_set(doomed) == 50);

    std::vector<int> expected;
    for (int i = 50; i < 100; ++i) {
        expected.push_back(i);
    }
    REQUIRE(collect_values(map) == expected);
    REQUIRE(map.next_id() == Id(0));
    check_invariants(map);
}

TEST_CASE("IdMap retain filter", "[structures][idmap][scenario]") {
    IdMap<int> map;
    for (int i = 0; i < 100; ++i) {
        map.insert(i);
    }

    map.retain([](Id, int& v) { return v % 2 == 0; });

    std::vector<int> expected;
    for (int i = 0; i < 100; i += 2) {
        expected.push_back(i);
    }
    REQUIRE(collect_values(map) == expected);
    check_invariants(map);

    SECTION("retain is idempotent") {
        IdMap<int> once = map;
        map.retain([](Id, int& v) { return v % 2 == 0; });
        REQUIRE(map == once);
    }
}

TEST_CASE("IdMap id reuse", "[structures][idmap][scenario]") {
    IdMap<int> map;
    for (int i = 0; i < 10; ++i) {
        map.insert(i);
    }

    map.remove(Id(7));
    map.remove(Id(2));
    map.remove(Id(5));

    REQUIRE(map.insert(100) == Id(2));
    REQUIRE(map.insert(101) == Id(5));
    REQUIRE(map.insert(102) == Id(7));
    REQUIRE(map.insert(103) == Id(10));
    check_invariants(map);
}

TEST_CASE("IdMap churn keeps invariants", "[structures][idmap][scenario]") {
    IdMap<int> map;
    for (int round = 0; round < 200; ++round) {
        const auto id = static_cast<std::size_t>((round * 37) % 64);
        switch (round % 5) {
            case 0:
            case 1:
                map.insert(round);
                break;
            case 2:
                map.remove(Id(id));
                break;
            case 3:
                map.insert_at(Id(id), round);
                break;
            default:
                map.retain([](Id i, int&) { return i.value % 7 != 3; });
                break;
        }
        check_invariants(map);
    }
}

// =============================================================================
// Lifetime Tests
// =============================================================================

TEST_CASE("IdMap destroys every value exactly once", "[structures][idmap][lifetime]") {
    Tracked::live = 0;

    SECTION("destruction") {
        {
            IdMap<Tracked> map;
            for (int i = 0; i < 40; ++i) {
                map.emplace(i);
            }
            REQUIRE(Tracked::live == 40);
        }
        REQUIRE(Tracked::live == 0);
    }

    SECTION("remove, clear and replacement") {
        {
            IdMap<Tracked> map;
            for (int i = 0; i < 10; ++i) {
                map.emplace(i);
            }
            auto removed = map.remove(Id(4));
            REQUIRE(Tracked::live == 10);
            removed.reset();
            REQUIRE(Tracked::live == 9);

            map.insert_at(Id(0), Tracked(50));
            REQUIRE(Tracked::live == 9);

            REQUIRE(map.erase(Id(1)));
            REQUIRE(map.remove_set(BitSet{2, 3}) == 2);
            REQUIRE(Tracked::live == 6);

            map.clear();
            REQUIRE(Tracked::live == 0);

            map.emplace(1);
        }
        REQUIRE(Tracked::live == 0);
    }

    SECTION("copy and shrink") {
        {
            IdMap<Tracked> map;
            for (int i = 0; i < 12; ++i) {
                map.emplace(i);
            }
            map.retain([](Id id, Tracked&) { return id.value < 3; });
            REQUIRE(Tracked::live == 3);

            IdMap<Tracked> copy(map);
            REQUIRE(Tracked::live == 6);
            REQUIRE(copy == map);

            map.shrink_to_fit();
            REQUIRE(Tracked::live == 6);
        }
        REQUIRE(Tracked::live == 0);
    }
}
