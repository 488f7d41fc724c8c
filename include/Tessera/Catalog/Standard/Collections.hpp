// Collections.hpp
// Collection interfaces and their hashed/array-backed implementations.
#pragma once

#include <Tessera/Catalog/Standard/Lang.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Tessera::Catalog::Standard
{

  class TESSERA_CATALOG_STANDARD_API Iterator : public virtual HostObject
  {
  public:
    [[nodiscard]] virtual bool HasNext() const = 0;
    [[nodiscard]] virtual std::expected<ObjectRef, Error> Next() = 0;
    // Removes the element last returned by Next.
    virtual std::expected<void, Error> Remove() = 0;

    friend void TesseraDescribe(Tag<Iterator>, ClassBuilder<Iterator> &);
  };

  class TESSERA_CATALOG_STANDARD_API Collection : public virtual HostObject
  {
  public:
    virtual bool Add(const ObjectRef &value) = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual bool Contains(const ObjectRef &value) const = 0;
    [[nodiscard]] virtual bool IsEmpty() const { return Size() == 0; }
    [[nodiscard]] virtual std::shared_ptr<Iterator> MakeIterator() = 0;
    virtual bool Remove(const ObjectRef &value) = 0;
    [[nodiscard]] virtual std::int32_t Size() const = 0;

    friend void TesseraDescribe(Tag<Collection>, ClassBuilder<Collection> &);
  };

  class TESSERA_CATALOG_STANDARD_API List : public Collection
  {
  public:
    // Each returns the element previously stored at the index.
    virtual std::expected<ObjectRef, Error> SetAt(std::int32_t index, const ObjectRef &value) = 0;
    [[nodiscard]] virtual std::expected<ObjectRef, Error> GetAt(std::int32_t index) const = 0;
    virtual std::expected<ObjectRef, Error> RemoveAt(std::int32_t index) = 0;

    friend void TesseraDescribe(Tag<List>, ClassBuilder<List> &);
  };

  class TESSERA_CATALOG_STANDARD_API ArrayList final : public Object, public List
  {
  public:
    ArrayList() = default;

    bool Add(const ObjectRef &value) override;
    void Clear() override { m_items.clear(); }
    [[nodiscard]] bool Contains(const ObjectRef &value) const override;
    [[nodiscard]] std::shared_ptr<Iterator> MakeIterator() override;
    bool Remove(const ObjectRef &value) override;
    [[nodiscard]] std::int32_t Size() const override { return static_cast<std::int32_t>(m_items.size()); }

    std::expected<ObjectRef, Error> SetAt(std::int32_t index, const ObjectRef &value) override;
    [[nodiscard]] std::expected<ObjectRef, Error> GetAt(std::int32_t index) const override;
    std::expected<ObjectRef, Error> RemoveAt(std::int32_t index) override;

    [[nodiscard]] bool Equals(const ObjectRef &other) const override;
    [[nodiscard]] std::int32_t HashCode() const override;
    [[nodiscard]] std::shared_ptr<String> ToString() const override;

    friend void TesseraDescribe(Tag<ArrayList>, ClassBuilder<ArrayList> &);

  private:
    std::vector<ObjectRef> m_items;
  };

  class TESSERA_CATALOG_STANDARD_API Set : public Collection
  {
  public:
    friend void TesseraDescribe(Tag<Set>, ClassBuilder<Set> &);
  };

  class TESSERA_CATALOG_STANDARD_API HashSet final : public Object, public Set
  {
  public:
    HashSet() = default;

    bool Add(const ObjectRef &value) override { return m_items.insert(value).second; }
    void Clear() override { m_items.clear(); }
    [[nodiscard]] bool Contains(const ObjectRef &value) const override { return m_items.contains(value); }
    [[nodiscard]] std::shared_ptr<Iterator> MakeIterator() override;
    bool Remove(const ObjectRef &value) override { return m_items.erase(value) > 0; }
    [[nodiscard]] std::int32_t Size() const override { return static_cast<std::int32_t>(m_items.size()); }

    [[nodiscard]] bool Equals(const ObjectRef &other) const override;
    [[nodiscard]] std::int32_t HashCode() const override;

    friend void TesseraDescribe(Tag<HashSet>, ClassBuilder<HashSet> &);

  private:
    std::unordered_set<ObjectRef, ObjectHash, ObjectEqual> m_items;
  };

  class TESSERA_CATALOG_STANDARD_API Map : public virtual HostObject
  {
  public:
    // Put and Remove return the previous value (null when there was none).
    virtual ObjectRef Put(const ObjectRef &key, const ObjectRef &value) = 0;
    [[nodiscard]] virtual ObjectRef Get(const ObjectRef &key) const = 0;
    virtual ObjectRef Remove(const ObjectRef &key) = 0;
    [[nodiscard]] virtual bool IsEmpty() const { return Size() == 0; }
    [[nodiscard]] virtual std::int32_t Size() const = 0;
    [[nodiscard]] virtual bool ContainsKey(const ObjectRef &key) const = 0;
    [[nodiscard]] virtual bool ContainsValue(const ObjectRef &value) const = 0;
    // Snapshots, not live views.
    [[nodiscard]] virtual std::shared_ptr<Set> KeySet() const = 0;
    [[nodiscard]] virtual std::shared_ptr<Collection> Values() const = 0;

    friend void TesseraDescribe(Tag<Map>, ClassBuilder<Map> &);
  };

  class TESSERA_CATALOG_STANDARD_API HashMap final : public Object, public Map
  {
  public:
    HashMap() = default;

    ObjectRef Put(const ObjectRef &key, const ObjectRef &value) override;
    [[nodiscard]] ObjectRef Get(const ObjectRef &key) const override;
    ObjectRef Remove(const ObjectRef &key) override;
    [[nodiscard]] std::int32_t Size() const override { return static_cast<std::int32_t>(m_entries.size()); }
    [[nodiscard]] bool ContainsKey(const ObjectRef &key) const override { return m_entries.contains(key); }
    [[nodiscard]] bool ContainsValue(const ObjectRef &value) const override;
    [[nodiscard]] std::shared_ptr<Set> KeySet() const override;
    [[nodiscard]] std::shared_ptr<Collection> Values() const override;

    friend void TesseraDescribe(Tag<HashMap>, ClassBuilder<HashMap> &);

  private:
    std::unordered_map<ObjectRef, ObjectRef, ObjectHash, ObjectEqual> m_entries;
  };

} // namespace Tessera::Catalog::Standard
