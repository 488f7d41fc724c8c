// Fixtures.hpp - small host class graph shared by the core catalogue tests

#pragma once

#include <Tessera/Catalog/Catalog.hpp>

#include <cstdint>
#include <expected>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace CatalogFixtures
{
  using namespace Tessera::Catalog;

  class Root : public virtual HostObject
  {
  public:
    std::int32_t tag{1};

    virtual bool Equals(const std::shared_ptr<Root> &other) const { return other.get() == this; }
    virtual std::int32_t HashCode() const { return 17; }

    friend void TesseraDescribe(Tag<Root>, ClassBuilder<Root> &b)
    {
      b.SetName("Root")
          .Root()
          .Field<&Root::tag>("tag")
          .Method<&Root::Equals>("equals")
          .Method<&Root::HashCode>("hashCode");
    }
  };

  class Text final : public Root
  {
  public:
    Text() = default;
    explicit Text(std::string value) : m_value(std::move(value)) {}

    std::int32_t Length() const { return static_cast<std::int32_t>(m_value.size()); }

    friend void TesseraDescribe(Tag<Text>, ClassBuilder<Text> &b)
    {
      b.SetName("Text").Extends<Root>().Constructor<>().Method<&Text::Length>("length");
    }

  private:
    std::string m_value;
  };

  class Shape : public virtual HostObject
  {
  public:
    virtual std::int32_t Area() const = 0;

    friend void TesseraDescribe(Tag<Shape>, ClassBuilder<Shape> &b)
    {
      b.SetName("Shape").Interface().Method<&Shape::Area>("area");
    }
  };

  // Unrelated to Widget apart from the shared root.
  class Gadget final : public Root
  {
  public:
    friend void TesseraDescribe(Tag<Gadget>, ClassBuilder<Gadget> &b) { b.SetName("Gadget").Extends<Root>(); }
  };

  class Widget final : public Root, public Shape
  {
  public:
    Widget() = default;
    explicit Widget(std::int32_t initial) : x(initial) {}

    std::int32_t x{0};
    const std::int32_t id{7};
    static constexpr std::int32_t Limit = 10;
    static inline std::int32_t Counter = 0;

    std::int32_t GetX() const { return -1; }
    std::int32_t GetY() const { return m_y; }
    void SetY(std::int32_t y) { m_y = y; }
    bool IsVisible() const { return m_visible; }
    void SetVisible(bool visible) { m_visible = visible; }
    std::int32_t Frob(std::int32_t v) const { return v + 1; }
    std::int32_t FrobText(const std::shared_ptr<Text> &text) const { return text ? text->Length() : 0; }
    std::int32_t Area() const override { return x * m_y; }
    std::shared_ptr<Text> Label() const { return std::make_shared<Text>("widget"); }
    std::expected<std::int32_t, Error> Checked(std::int32_t v) const
    {
      if (v < 0)
        return std::unexpected(Error{ErrorCode::HostFailure, "negative input"});
      return v;
    }

    static std::int32_t Twice(std::int32_t v) { return v * 2; }
    static std::int32_t Instances() { return 0; }
    static std::shared_ptr<Root> Box(std::int32_t v) { return std::make_shared<Widget>(v); }
    // Declared like Box but hands back a Gadget.
    static std::shared_ptr<Root> Stray(std::int32_t) { return std::make_shared<Gadget>(); }

    friend void TesseraDescribe(Tag<Widget>, ClassBuilder<Widget> &b)
    {
      b.SetName("Widget")
          .Extends<Root>()
          .Implements<Shape>()
          .Constructor<>()
          .Constructor<std::int32_t>()
          .Field<&Widget::x>("x")
          .Field<&Widget::id>("id")
          .StaticField<&Widget::Limit>("LIMIT")
          .StaticField<&Widget::Counter>("COUNTER")
          .Method<&Widget::GetX>("getX")
          .Method<&Widget::GetY>("getY")
          .Method<&Widget::SetY>("setY")
          .Method<&Widget::IsVisible>("isVisible")
          .Method<&Widget::SetVisible>("setVisible")
          .Method<&Widget::Frob>("frob")
          .Method<&Widget::FrobText>("frobText")
          .Method<&Widget::Label>("label")
          .Method<&Widget::Checked>("checked")
          .StaticMethod<&Widget::Twice>("twice")
          .StaticMethod<&Widget::Instances>("instances")
          .StaticMethod<&Widget::Box>("box")
          .StaticMethod<&Widget::Stray>("stray");
    }

  private:
    std::int32_t m_y{3};
    bool m_visible{true};
  };

  inline std::shared_ptr<HostRegistry> MakeRegistry()
  {
    auto registry = std::make_shared<HostRegistry>();
    registry->RegisterClasses<Root, Text, Shape, Widget, Gadget>();
    return registry;
  }

  // Registers the fixture structs; the builder is left in the struct phase.
  inline void AddFixtureStructs(DefinitionBuilder &b)
  {
    (void)b.AddStruct("void", ClassIdOf<void>());
    (void)b.AddStruct("boolean", ClassIdOf<bool>());
    (void)b.AddStruct("byte", ClassIdOf<std::int8_t>());
    (void)b.AddStruct("int", ClassIdOf<std::int32_t>());
    (void)b.AddStruct("long", ClassIdOf<std::int64_t>());
    (void)b.AddStruct("double", ClassIdOf<double>());
    (void)b.AddStruct("Root", ClassIdOf<Root>());
    (void)b.AddStruct("def", ClassIdOf<Root>());
    (void)b.AddStruct("Text", ClassIdOf<Text>());
    (void)b.AddStruct("Shape", ClassIdOf<Shape>());
    (void)b.AddStruct("Widget", ClassIdOf<Widget>());
    (void)b.AddStruct("Gadget", ClassIdOf<Gadget>());
  }

  inline DefinitionBuilder MakeBuilder(DefinitionOptions options = {})
  {
    DefinitionBuilder b{MakeRegistry(), options};
    AddFixtureStructs(b);
    return b;
  }

  inline Type TypeOf(const DefinitionBuilder &b, std::string_view name)
  {
    return b.GetType(name).value();
  }

  inline std::vector<Type> TypesOf(const DefinitionBuilder &b, std::initializer_list<std::string_view> names)
  {
    std::vector<Type> out;
    for (const auto name : names)
      out.push_back(TypeOf(b, name));
    return out;
  }
} // namespace CatalogFixtures
