#include <Tessera/Catalog/ClassBuilder.hpp>
#include <Tessera/Catalog/Standard/Collections.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace Tessera::Catalog::Standard
{

  namespace
  {
    Error IndexOutOfBounds(std::int32_t index, std::int32_t size)
    {
      return HostError("IndexOutOfBoundsException", fmt::format("index {} out of bounds for length {}", index, size));
    }

    Error Exhausted()
    {
      return HostError("NoSuchElementException", "iterator has no more elements");
    }

    Error RemoveWithoutNext()
    {
      return HostError("IllegalStateException", "remove requires a preceding call to next");
    }

    // Walks the list by index, so it observes removals made through itself.
    class ListIterator final : public Object, public Iterator
    {
    public:
      ListIterator(ArrayList &owner, Ref keepAlive) : m_owner(&owner), m_keepAlive(std::move(keepAlive)) {}

      bool HasNext() const override { return m_cursor < m_owner->Size(); }

      std::expected<ObjectRef, Error> Next() override
      {
        if (!HasNext())
          return std::unexpected(Exhausted());
        auto value = m_owner->GetAt(m_cursor);
        if (!value)
          return value;
        m_last = m_cursor++;
        return value;
      }

      std::expected<void, Error> Remove() override
      {
        if (m_last < 0)
          return std::unexpected(RemoveWithoutNext());
        auto removed = m_owner->RemoveAt(m_last);
        if (!removed)
          return std::unexpected(std::move(removed.error()));
        m_cursor = m_last;
        m_last = -1;
        return {};
      }

    private:
      ArrayList *m_owner;
      Ref m_keepAlive;
      std::int32_t m_cursor{0};
      std::int32_t m_last{-1};
    };

    // Iterates a snapshot of the elements taken when the iterator was created.
    class SetIterator final : public Object, public Iterator
    {
    public:
      SetIterator(Collection &owner, Ref keepAlive, std::vector<ObjectRef> items)
          : m_owner(&owner), m_keepAlive(std::move(keepAlive)), m_items(std::move(items))
      {
      }

      bool HasNext() const override { return m_cursor < m_items.size(); }

      std::expected<ObjectRef, Error> Next() override
      {
        if (!HasNext())
          return std::unexpected(Exhausted());
        m_hasLast = true;
        return m_items[m_cursor++];
      }

      std::expected<void, Error> Remove() override
      {
        if (!m_hasLast)
          return std::unexpected(RemoveWithoutNext());
        m_owner->Remove(m_items[m_cursor - 1]);
        m_hasLast = false;
        return {};
      }

    private:
      Collection *m_owner;
      Ref m_keepAlive;
      std::vector<ObjectRef> m_items;
      std::size_t m_cursor{0};
      bool m_hasLast{false};
    };

    std::int32_t HashOf(const ObjectRef &value)
    {
      return value ? value->HashCode() : 0;
    }
  } // namespace

  void TesseraDescribe(Tag<Iterator>, ClassBuilder<Iterator> &b)
  {
    b.SetName("Iterator")
        .Interface()
        .Method<&Iterator::HasNext>("hasNext")
        .Method<&Iterator::Next>("next")
        .Method<&Iterator::Remove>("remove");
  }

  void TesseraDescribe(Tag<Collection>, ClassBuilder<Collection> &b)
  {
    b.SetName("Collection")
        .Interface()
        .Method<&Collection::Add>("add")
        .Method<&Collection::Clear>("clear")
        .Method<&Collection::Contains>("contains")
        .Method<&Collection::IsEmpty>("isEmpty")
        .Method<&Collection::MakeIterator>("iterator")
        .Method<&Collection::Remove>("remove")
        .Method<&Collection::Size>("size");
  }

  void TesseraDescribe(Tag<List>, ClassBuilder<List> &b)
  {
    b.SetName("List")
        .Interface()
        .Implements<Collection>()
        .Method<&List::SetAt>("set")
        .Method<&List::GetAt>("get")
        .Method<&List::RemoveAt>("remove");
  }

  void TesseraDescribe(Tag<Set>, ClassBuilder<Set> &b)
  {
    b.SetName("Set").Interface().Implements<Collection>();
  }

  void TesseraDescribe(Tag<Map>, ClassBuilder<Map> &b)
  {
    b.SetName("Map")
        .Interface()
        .Method<&Map::Put>("put")
        .Method<&Map::Get>("get")
        .Method<&Map::Remove>("remove")
        .Method<&Map::IsEmpty>("isEmpty")
        .Method<&Map::Size>("size")
        .Method<&Map::ContainsKey>("containsKey")
        .Method<&Map::ContainsValue>("containsValue")
        .Method<&Map::KeySet>("keySet")
        .Method<&Map::Values>("values");
  }

  // ArrayList

  bool ArrayList::Add(const ObjectRef &value)
  {
    m_items.push_back(value);
    return true;
  }

  bool ArrayList::Contains(const ObjectRef &value) const
  {
    return std::any_of(m_items.begin(), m_items.end(), [&](const ObjectRef &item) { return ObjectEqual{}(item, value); });
  }

  std::shared_ptr<Iterator> ArrayList::MakeIterator()
  {
    return std::make_shared<ListIterator>(*this, weak_from_this().lock());
  }

  bool ArrayList::Remove(const ObjectRef &value)
  {
    const auto it =
        std::find_if(m_items.begin(), m_items.end(), [&](const ObjectRef &item) { return ObjectEqual{}(item, value); });
    if (it == m_items.end())
      return false;
    m_items.erase(it);
    return true;
  }

  std::expected<ObjectRef, Error> ArrayList::SetAt(std::int32_t index, const ObjectRef &value)
  {
    if (index < 0 || index >= Size())
      return std::unexpected(IndexOutOfBounds(index, Size()));
    return std::exchange(m_items[static_cast<std::size_t>(index)], value);
  }

  std::expected<ObjectRef, Error> ArrayList::GetAt(std::int32_t index) const
  {
    if (index < 0 || index >= Size())
      return std::unexpected(IndexOutOfBounds(index, Size()));
    return m_items[static_cast<std::size_t>(index)];
  }

  std::expected<ObjectRef, Error> ArrayList::RemoveAt(std::int32_t index)
  {
    if (index < 0 || index >= Size())
      return std::unexpected(IndexOutOfBounds(index, Size()));
    const auto it = m_items.begin() + index;
    auto removed = std::move(*it);
    m_items.erase(it);
    return removed;
  }

  bool ArrayList::Equals(const ObjectRef &other) const
  {
    const auto *list = dynamic_cast<const List *>(other.get());
    if (!list)
      return false;
    if (list == this)
      return true;
    if (list->Size() != Size())
      return false;
    for (std::int32_t i = 0; i < Size(); ++i)
    {
      auto item = list->GetAt(i);
      if (!item || !ObjectEqual{}(m_items[static_cast<std::size_t>(i)], *item))
        return false;
    }
    return true;
  }

  std::int32_t ArrayList::HashCode() const
  {
    std::uint32_t h = 1;
    for (const auto &item : m_items)
      h = 31 * h + static_cast<std::uint32_t>(HashOf(item));
    return static_cast<std::int32_t>(h);
  }

  std::shared_ptr<String> ArrayList::ToString() const
  {
    std::string text = "[";
    for (std::size_t i = 0; i < m_items.size(); ++i)
    {
      if (i > 0)
        text += ", ";
      text += m_items[i] ? m_items[i]->ToString()->Value() : "null";
    }
    text += "]";
    return String::Make(std::move(text));
  }

  void TesseraDescribe(Tag<ArrayList>, ClassBuilder<ArrayList> &b)
  {
    b.SetName("ArrayList").Extends<Object>().Implements<List>().Constructor<>();
  }

  // HashSet

  std::shared_ptr<Iterator> HashSet::MakeIterator()
  {
    return std::make_shared<SetIterator>(*this, weak_from_this().lock(),
                                         std::vector<ObjectRef>{m_items.begin(), m_items.end()});
  }

  bool HashSet::Equals(const ObjectRef &other) const
  {
    const auto *set = dynamic_cast<const Set *>(other.get());
    if (!set)
      return false;
    if (set == this)
      return true;
    if (set->Size() != Size())
      return false;
    return std::all_of(m_items.begin(), m_items.end(), [&](const ObjectRef &item) { return set->Contains(item); });
  }

  std::int32_t HashSet::HashCode() const
  {
    std::uint32_t h = 0;
    for (const auto &item : m_items)
      h += static_cast<std::uint32_t>(HashOf(item));
    return static_cast<std::int32_t>(h);
  }

  void TesseraDescribe(Tag<HashSet>, ClassBuilder<HashSet> &b)
  {
    b.SetName("HashSet").Extends<Object>().Implements<Set>().Constructor<>();
  }

  // HashMap

  ObjectRef HashMap::Put(const ObjectRef &key, const ObjectRef &value)
  {
    auto [it, inserted] = m_entries.try_emplace(key, value);
    if (inserted)
      return nullptr;
    return std::exchange(it->second, value);
  }

  ObjectRef HashMap::Get(const ObjectRef &key) const
  {
    const auto it = m_entries.find(key);
    return it == m_entries.end() ? nullptr : it->second;
  }

  ObjectRef HashMap::Remove(const ObjectRef &key)
  {
    const auto it = m_entries.find(key);
    if (it == m_entries.end())
      return nullptr;
    auto previous = std::move(it->second);
    m_entries.erase(it);
    return previous;
  }

  bool HashMap::ContainsValue(const ObjectRef &value) const
  {
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [&](const auto &entry) { return ObjectEqual{}(entry.second, value); });
  }

  std::shared_ptr<Set> HashMap::KeySet() const
  {
    auto keys = std::make_shared<HashSet>();
    for (const auto &[key, value] : m_entries)
      keys->Add(key);
    return keys;
  }

  std::shared_ptr<Collection> HashMap::Values() const
  {
    auto values = std::make_shared<ArrayList>();
    for (const auto &[key, value] : m_entries)
      values->Add(value);
    return values;
  }

  void TesseraDescribe(Tag<HashMap>, ClassBuilder<HashMap> &b)
  {
    b.SetName("HashMap").Extends<Object>().Implements<Map>().Constructor<>();
  }

} // namespace Tessera::Catalog::Standard
