#include <Tessera/Catalog/ClassBuilder.hpp>
#include <Tessera/Catalog/DefinitionBuilder.hpp>
#include <Tessera/Catalog/Standard/Collections.hpp>
#include <Tessera/Catalog/Standard/Conversions.hpp>
#include <Tessera/Catalog/Standard/FeatureTest.hpp>
#include <Tessera/Catalog/Standard/Lang.hpp>
#include <Tessera/Catalog/Numeric.hpp>
#include <Tessera/Catalog/Standard/StandardDefinition.hpp>

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Tessera::Catalog::Standard
{

  namespace
  {
    constexpr bool Static = true;
    constexpr bool Instance = false;
    constexpr bool Explicit = true;
    constexpr bool Implicit = false;

    using Names = std::initializer_list<std::string_view>;

    // Builder front end taking type names as strings. Keeps the first failure so the whitelist
    // reads as a flat table; the builder rejects every later operation once one has failed.
    class Whitelist
    {
    public:
      explicit Whitelist(DefinitionBuilder &builder) : m_builder(builder) {}

      void AddStruct(std::string_view name, ClassId clazz) { Record(m_builder.AddStruct(name, clazz)); }

      void AddConstructor(std::string_view owner, Names arguments)
      {
        std::vector<Type> args;
        if (ResolveAll(arguments, args))
          Record(m_builder.AddConstructor(owner, "new", args));
      }

      void AddMethod(std::string_view owner, std::string_view name, bool isStatic, std::string_view returnType,
                     Names arguments)
      {
        AddMethod(owner, name, {}, isStatic, returnType, arguments, {}, {});
      }

      // Empty generic names leave the script-visible types equal to the declared ones.
      void AddMethod(std::string_view owner, std::string_view name, std::string_view alias, bool isStatic,
                     std::string_view returnType, Names arguments, std::string_view genericReturn,
                     Names genericArguments)
      {
        auto rtn = Resolve(returnType);
        std::vector<Type> args;
        std::vector<Type> generics;
        if (!rtn || !ResolveAll(arguments, args) || !ResolveAll(genericArguments, generics))
          return;
        std::optional<Type> genericRtn;
        if (!genericReturn.empty())
        {
          genericRtn = Resolve(genericReturn);
          if (!genericRtn)
            return;
        }
        Record(m_builder.AddMethod(owner, name, alias, isStatic, *rtn, args, genericRtn, generics));
      }

      void AddField(std::string_view owner, std::string_view name, bool isStatic, std::string_view type)
      {
        if (auto resolved = Resolve(type))
          Record(m_builder.AddField(owner, name, {}, isStatic, *resolved));
      }

      void CopyStruct(std::string_view owner, Names parents) { Record(m_builder.CopyStruct(owner, parents)); }

      void AddTransform(std::string_view from, std::string_view to, bool isExplicit)
      {
        auto f = Resolve(from);
        auto t = Resolve(to);
        if (f && t)
          Record(m_builder.AddTransform(*f, *t, isExplicit));
      }

      void AddTransform(std::string_view from, std::string_view to, std::string_view owner, std::string_view adapter,
                        bool isStatic, bool isExplicit)
      {
        auto f = Resolve(from);
        auto t = Resolve(to);
        if (f && t)
          Record(m_builder.AddTransform(*f, *t, owner, adapter, isStatic, isExplicit));
      }

      void AddRuntimeClass(std::string_view name) { Record(m_builder.AddRuntimeClass(name)); }

      [[nodiscard]] std::expected<void, Error> Result() const
      {
        if (m_error)
          return std::unexpected(*m_error);
        return {};
      }

    private:
      std::optional<Type> Resolve(std::string_view name)
      {
        auto type = m_builder.GetType(name);
        if (!type)
        {
          Record(std::unexpected(std::move(type.error())));
          return std::nullopt;
        }
        return std::move(*type);
      }

      bool ResolveAll(Names names, std::vector<Type> &out)
      {
        out.reserve(names.size());
        for (const auto name : names)
        {
          auto type = Resolve(name);
          if (!type)
            return false;
          out.push_back(std::move(*type));
        }
        return true;
      }

      void Record(std::expected<void, Error> result)
      {
        if (!result && !m_error)
          m_error = std::move(result.error());
      }

      DefinitionBuilder &m_builder;
      std::optional<Error> m_error;
    };

    struct AdapterEdge
    {
      std::string_view from;
      std::string_view to;
      std::string_view owner;
      std::string_view adapter;
      bool isStatic;
      bool isExplicit;
    };

    // Conversions that run through a host method: boxing, unboxing, cross-box and dynamic edges.
    constexpr AdapterEdge AdapterEdges[] = {
      {"boolean", "Object", "Boolean", "valueOf", Static, Implicit},
      {"boolean", "def", "Boolean", "valueOf", Static, Implicit},
      {"boolean", "Boolean", "Boolean", "valueOf", Static, Implicit},
      {"byte", "Object", "Byte", "valueOf", Static, Implicit},
      {"byte", "def", "Byte", "valueOf", Static, Implicit},
      {"byte", "Number", "Byte", "valueOf", Static, Implicit},
      {"byte", "Byte", "Byte", "valueOf", Static, Implicit},
      {"byte", "Short", "Utility", "byteToShort", Static, Implicit},
      {"byte", "Character", "Utility", "byteToCharacter", Static, Explicit},
      {"byte", "Integer", "Utility", "byteToInteger", Static, Implicit},
      {"byte", "Long", "Utility", "byteToLong", Static, Implicit},
      {"byte", "Float", "Utility", "byteToFloat", Static, Implicit},
      {"byte", "Double", "Utility", "byteToDouble", Static, Implicit},
      {"short", "Object", "Short", "valueOf", Static, Implicit},
      {"short", "def", "Short", "valueOf", Static, Implicit},
      {"short", "Number", "Short", "valueOf", Static, Implicit},
      {"short", "Byte", "Utility", "shortToByte", Static, Explicit},
      {"short", "Short", "Short", "valueOf", Static, Implicit},
      {"short", "Character", "Utility", "shortToCharacter", Static, Explicit},
      {"short", "Integer", "Utility", "shortToInteger", Static, Implicit},
      {"short", "Long", "Utility", "shortToLong", Static, Implicit},
      {"short", "Float", "Utility", "shortToFloat", Static, Implicit},
      {"short", "Double", "Utility", "shortToDouble", Static, Implicit},
      {"char", "Object", "Character", "valueOf", Static, Implicit},
      {"char", "def", "Character", "valueOf", Static, Implicit},
      {"char", "Number", "Utility", "charToInteger", Static, Implicit},
      {"char", "Byte", "Utility", "charToByte", Static, Explicit},
      {"char", "Short", "Utility", "charToShort", Static, Explicit},
      {"char", "Character", "Character", "valueOf", Static, Implicit},
      {"char", "Integer", "Utility", "charToInteger", Static, Implicit},
      {"char", "Long", "Utility", "charToLong", Static, Implicit},
      {"char", "Float", "Utility", "charToFloat", Static, Implicit},
      {"char", "Double", "Utility", "charToDouble", Static, Implicit},
      {"char", "String", "Utility", "charToString", Static, Explicit},
      {"int", "Object", "Integer", "valueOf", Static, Implicit},
      {"int", "def", "Integer", "valueOf", Static, Implicit},
      {"int", "Number", "Integer", "valueOf", Static, Implicit},
      {"int", "Byte", "Utility", "intToByte", Static, Explicit},
      {"int", "Short", "Utility", "intToShort", Static, Explicit},
      {"int", "Character", "Utility", "intToCharacter", Static, Explicit},
      {"int", "Integer", "Integer", "valueOf", Static, Implicit},
      {"int", "Long", "Utility", "intToLong", Static, Implicit},
      {"int", "Float", "Utility", "intToFloat", Static, Implicit},
      {"int", "Double", "Utility", "intToDouble", Static, Implicit},
      {"long", "Object", "Long", "valueOf", Static, Implicit},
      {"long", "def", "Long", "valueOf", Static, Implicit},
      {"long", "Number", "Long", "valueOf", Static, Implicit},
      {"long", "Byte", "Utility", "longToByte", Static, Explicit},
      {"long", "Short", "Utility", "longToShort", Static, Explicit},
      {"long", "Character", "Utility", "longToCharacter", Static, Explicit},
      {"long", "Integer", "Utility", "longToInteger", Static, Explicit},
      {"long", "Long", "Long", "valueOf", Static, Implicit},
      {"long", "Float", "Utility", "longToFloat", Static, Implicit},
      {"long", "Double", "Utility", "longToDouble", Static, Implicit},
      {"float", "Object", "Float", "valueOf", Static, Implicit},
      {"float", "def", "Float", "valueOf", Static, Implicit},
      {"float", "Number", "Float", "valueOf", Static, Implicit},
      {"float", "Byte", "Utility", "floatToByte", Static, Explicit},
      {"float", "Short", "Utility", "floatToShort", Static, Explicit},
      {"float", "Character", "Utility", "floatToCharacter", Static, Explicit},
      {"float", "Integer", "Utility", "floatToInteger", Static, Explicit},
      {"float", "Long", "Utility", "floatToLong", Static, Explicit},
      {"float", "Float", "Float", "valueOf", Static, Implicit},
      {"float", "Double", "Utility", "floatToDouble", Static, Implicit},
      {"double", "Object", "Double", "valueOf", Static, Implicit},
      {"double", "def", "Double", "valueOf", Static, Implicit},
      {"double", "Number", "Double", "valueOf", Static, Implicit},
      {"double", "Byte", "Utility", "doubleToByte", Static, Explicit},
      {"double", "Short", "Utility", "doubleToShort", Static, Explicit},
      {"double", "Character", "Utility", "doubleToCharacter", Static, Explicit},
      {"double", "Integer", "Utility", "doubleToInteger", Static, Explicit},
      {"double", "Long", "Utility", "doubleToLong", Static, Explicit},
      {"double", "Float", "Utility", "doubleToFloat", Static, Explicit},
      {"double", "Double", "Double", "valueOf", Static, Implicit},
      {"Object", "boolean", "Boolean", "booleanValue", Instance, Explicit},
      {"Object", "byte", "Number", "byteValue", Instance, Explicit},
      {"Object", "short", "Number", "shortValue", Instance, Explicit},
      {"Object", "char", "Character", "charValue", Instance, Explicit},
      {"Object", "int", "Number", "intValue", Instance, Explicit},
      {"Object", "long", "Number", "longValue", Instance, Explicit},
      {"Object", "float", "Number", "floatValue", Instance, Explicit},
      {"Object", "double", "Number", "doubleValue", Instance, Explicit},
      {"def", "boolean", "Boolean", "booleanValue", Instance, Implicit},
      {"def", "byte", "Def", "DefTobyteImplicit", Static, Implicit},
      {"def", "short", "Def", "DefToshortImplicit", Static, Implicit},
      {"def", "char", "Def", "DefTocharImplicit", Static, Implicit},
      {"def", "int", "Def", "DefTointImplicit", Static, Implicit},
      {"def", "long", "Def", "DefTolongImplicit", Static, Implicit},
      {"def", "float", "Def", "DefTofloatImplicit", Static, Implicit},
      {"def", "double", "Def", "DefTodoubleImplicit", Static, Implicit},
      {"def", "Byte", "Def", "DefToByteImplicit", Static, Implicit},
      {"def", "Short", "Def", "DefToShortImplicit", Static, Implicit},
      {"def", "Character", "Def", "DefToCharacterImplicit", Static, Implicit},
      {"def", "Integer", "Def", "DefToIntegerImplicit", Static, Implicit},
      {"def", "Long", "Def", "DefToLongImplicit", Static, Implicit},
      {"def", "Float", "Def", "DefToFloatImplicit", Static, Implicit},
      {"def", "Double", "Def", "DefToDoubleImplicit", Static, Implicit},
      {"def", "byte", "Def", "DefTobyteExplicit", Static, Explicit},
      {"def", "short", "Def", "DefToshortExplicit", Static, Explicit},
      {"def", "char", "Def", "DefTocharExplicit", Static, Explicit},
      {"def", "int", "Def", "DefTointExplicit", Static, Explicit},
      {"def", "long", "Def", "DefTolongExplicit", Static, Explicit},
      {"def", "float", "Def", "DefTofloatExplicit", Static, Explicit},
      {"def", "double", "Def", "DefTodoubleExplicit", Static, Explicit},
      {"def", "Byte", "Def", "DefToByteExplicit", Static, Explicit},
      {"def", "Short", "Def", "DefToShortExplicit", Static, Explicit},
      {"def", "Character", "Def", "DefToCharacterExplicit", Static, Explicit},
      {"def", "Integer", "Def", "DefToIntegerExplicit", Static, Explicit},
      {"def", "Long", "Def", "DefToLongExplicit", Static, Explicit},
      {"def", "Float", "Def", "DefToFloatExplicit", Static, Explicit},
      {"def", "Double", "Def", "DefToDoubleExplicit", Static, Explicit},
      {"Number", "byte", "Number", "byteValue", Instance, Explicit},
      {"Number", "short", "Number", "shortValue", Instance, Explicit},
      {"Number", "char", "Utility", "NumberTochar", Static, Explicit},
      {"Number", "int", "Number", "intValue", Instance, Explicit},
      {"Number", "long", "Number", "longValue", Instance, Explicit},
      {"Number", "float", "Number", "floatValue", Instance, Explicit},
      {"Number", "double", "Number", "doubleValue", Instance, Explicit},
      {"Number", "Boolean", "Utility", "NumberToBoolean", Static, Explicit},
      {"Number", "Byte", "Utility", "NumberToByte", Static, Explicit},
      {"Number", "Short", "Utility", "NumberToShort", Static, Explicit},
      {"Number", "Character", "Utility", "NumberToCharacter", Static, Explicit},
      {"Number", "Integer", "Utility", "NumberToInteger", Static, Explicit},
      {"Number", "Long", "Utility", "NumberToLong", Static, Explicit},
      {"Number", "Float", "Utility", "NumberToFloat", Static, Explicit},
      {"Number", "Double", "Utility", "NumberToDouble", Static, Explicit},
      {"Boolean", "boolean", "Boolean", "booleanValue", Instance, Implicit},
      {"Byte", "byte", "Byte", "byteValue", Instance, Implicit},
      {"Byte", "short", "Byte", "shortValue", Instance, Implicit},
      {"Byte", "char", "Utility", "ByteTochar", Static, Implicit},
      {"Byte", "int", "Byte", "intValue", Instance, Implicit},
      {"Byte", "long", "Byte", "longValue", Instance, Implicit},
      {"Byte", "float", "Byte", "floatValue", Instance, Implicit},
      {"Byte", "double", "Byte", "doubleValue", Instance, Implicit},
      {"Byte", "Short", "Utility", "NumberToShort", Static, Implicit},
      {"Byte", "Character", "Utility", "NumberToCharacter", Static, Implicit},
      {"Byte", "Integer", "Utility", "NumberToInteger", Static, Implicit},
      {"Byte", "Long", "Utility", "NumberToLong", Static, Implicit},
      {"Byte", "Float", "Utility", "NumberToFloat", Static, Implicit},
      {"Byte", "Double", "Utility", "NumberToDouble", Static, Implicit},
      {"Short", "byte", "Short", "byteValue", Instance, Explicit},
      {"Short", "short", "Short", "shortValue", Instance, Explicit},
      {"Short", "char", "Utility", "ShortTochar", Static, Implicit},
      {"Short", "int", "Short", "intValue", Instance, Implicit},
      {"Short", "long", "Short", "longValue", Instance, Implicit},
      {"Short", "float", "Short", "floatValue", Instance, Implicit},
      {"Short", "double", "Short", "doubleValue", Instance, Implicit},
      {"Short", "Byte", "Utility", "NumberToByte", Static, Explicit},
      {"Short", "Character", "Utility", "NumberToCharacter", Static, Explicit},
      {"Short", "Integer", "Utility", "NumberToInteger", Static, Implicit},
      {"Short", "Long", "Utility", "NumberToLong", Static, Implicit},
      {"Short", "Float", "Utility", "NumberToFloat", Static, Implicit},
      {"Short", "Double", "Utility", "NumberToDouble", Static, Implicit},
      {"Character", "byte", "Utility", "CharacterTobyte", Static, Explicit},
      {"Character", "short", "Utility", "CharacterToshort", Static, Implicit},
      {"Character", "char", "Character", "charValue", Instance, Explicit},
      {"Character", "int", "Utility", "CharacterToint", Static, Implicit},
      {"Character", "long", "Utility", "CharacterTolong", Static, Implicit},
      {"Character", "float", "Utility", "CharacterTofloat", Static, Implicit},
      {"Character", "double", "Utility", "CharacterTodouble", Static, Implicit},
      {"Character", "Byte", "Utility", "CharacterToByte", Static, Explicit},
      {"Character", "Short", "Utility", "CharacterToShort", Static, Explicit},
      {"Character", "Integer", "Utility", "CharacterToInteger", Static, Implicit},
      {"Character", "Long", "Utility", "CharacterToLong", Static, Implicit},
      {"Character", "Float", "Utility", "CharacterToFloat", Static, Implicit},
      {"Character", "Double", "Utility", "CharacterToDouble", Static, Implicit},
      {"Character", "String", "Utility", "CharacterToString", Static, Explicit},
      {"Integer", "byte", "Integer", "byteValue", Instance, Explicit},
      {"Integer", "short", "Integer", "shortValue", Instance, Explicit},
      {"Integer", "char", "Utility", "IntegerTochar", Static, Explicit},
      {"Integer", "int", "Integer", "intValue", Instance, Implicit},
      {"Integer", "long", "Integer", "longValue", Instance, Implicit},
      {"Integer", "float", "Integer", "floatValue", Instance, Implicit},
      {"Integer", "double", "Integer", "doubleValue", Instance, Implicit},
      {"Integer", "Byte", "Utility", "NumberToByte", Static, Explicit},
      {"Integer", "Short", "Utility", "NumberToShort", Static, Explicit},
      {"Integer", "Character", "Utility", "NumberToCharacter", Static, Explicit},
      {"Integer", "Long", "Utility", "NumberToLong", Static, Implicit},
      {"Integer", "Float", "Utility", "NumberToFloat", Static, Implicit},
      {"Integer", "Double", "Utility", "NumberToDouble", Static, Implicit},
      {"Long", "byte", "Long", "byteValue", Instance, Explicit},
      {"Long", "short", "Long", "shortValue", Instance, Explicit},
      {"Long", "char", "Utility", "LongTochar", Static, Explicit},
      {"Long", "int", "Long", "intValue", Instance, Explicit},
      {"Long", "long", "Long", "longValue", Instance, Implicit},
      {"Long", "float", "Long", "floatValue", Instance, Implicit},
      {"Long", "double", "Long", "doubleValue", Instance, Implicit},
      {"Long", "Byte", "Utility", "NumberToByte", Static, Explicit},
      {"Long", "Short", "Utility", "NumberToShort", Static, Explicit},
      {"Long", "Character", "Utility", "NumberToCharacter", Static, Explicit},
      {"Long", "Integer", "Utility", "NumberToInteger", Static, Explicit},
      {"Long", "Float", "Utility", "NumberToFloat", Static, Implicit},
      {"Long", "Double", "Utility", "NumberToDouble", Static, Implicit},
      {"Float", "byte", "Float", "byteValue", Instance, Explicit},
      {"Float", "short", "Float", "shortValue", Instance, Explicit},
      {"Float", "char", "Utility", "FloatTochar", Static, Explicit},
      {"Float", "int", "Float", "intValue", Instance, Explicit},
      {"Float", "long", "Float", "longValue", Instance, Explicit},
      {"Float", "float", "Float", "floatValue", Instance, Implicit},
      {"Float", "double", "Float", "doubleValue", Instance, Implicit},
      {"Float", "Byte", "Utility", "NumberToByte", Static, Explicit},
      {"Float", "Short", "Utility", "NumberToShort", Static, Explicit},
      {"Float", "Character", "Utility", "NumberToCharacter", Static, Explicit},
      {"Float", "Integer", "Utility", "NumberToInteger", Static, Explicit},
      {"Float", "Long", "Utility", "NumberToLong", Static, Explicit},
      {"Float", "Double", "Utility", "NumberToDouble", Static, Implicit},
      {"Double", "byte", "Double", "byteValue", Instance, Explicit},
      {"Double", "short", "Double", "shortValue", Instance, Explicit},
      {"Double", "char", "Utility", "DoubleTochar", Static, Explicit},
      {"Double", "int", "Double", "intValue", Instance, Explicit},
      {"Double", "long", "Double", "longValue", Instance, Explicit},
      {"Double", "float", "Double", "floatValue", Instance, Explicit},
      {"Double", "double", "Double", "doubleValue", Instance, Implicit},
      {"Double", "Byte", "Utility", "NumberToByte", Static, Explicit},
      {"Double", "Short", "Utility", "NumberToShort", Static, Explicit},
      {"Double", "Character", "Utility", "NumberToCharacter", Static, Explicit},
      {"Double", "Integer", "Utility", "NumberToInteger", Static, Explicit},
      {"Double", "Long", "Utility", "NumberToLong", Static, Explicit},
      {"Double", "Float", "Utility", "NumberToFloat", Static, Explicit},
      {"String", "char", "Utility", "StringTochar", Static, Explicit},
      {"String", "Character", "Utility", "StringToCharacter", Static, Explicit},
    };

    // Static conversion helpers; each name spells its own signature as "<argument>To<return>".
    constexpr std::string_view UtilityConversions[] = {
      "NumberToboolean", "NumberTochar", "NumberToBoolean", "NumberToByte", "NumberToShort", "NumberToCharacter",
      "NumberToInteger", "NumberToLong", "NumberToFloat", "NumberToDouble", "booleanTobyte", "booleanToshort",
      "booleanTochar", "booleanToint", "booleanTolong", "booleanTofloat", "booleanTodouble", "booleanToInteger",
      "BooleanTobyte", "BooleanToshort", "BooleanTochar", "BooleanToint", "BooleanTolong", "BooleanTofloat",
      "BooleanTodouble", "BooleanToByte", "BooleanToShort", "BooleanToCharacter", "BooleanToInteger",
      "BooleanToLong", "BooleanToFloat", "BooleanToDouble", "byteToboolean", "byteToShort", "byteToCharacter",
      "byteToInteger", "byteToLong", "byteToFloat", "byteToDouble", "ByteToboolean", "ByteTochar", "shortToboolean",
      "shortToByte", "shortToCharacter", "shortToInteger", "shortToLong", "shortToFloat", "shortToDouble",
      "ShortToboolean", "ShortTochar", "charToboolean", "charToByte", "charToShort", "charToInteger", "charToLong",
      "charToFloat", "charToDouble", "charToString", "CharacterToboolean", "CharacterTobyte", "CharacterToshort",
      "CharacterToint", "CharacterTolong", "CharacterTofloat", "CharacterTodouble", "CharacterToBoolean",
      "CharacterToByte", "CharacterToShort", "CharacterToInteger", "CharacterToLong", "CharacterToFloat",
      "CharacterToDouble", "CharacterToString", "intToboolean", "intToByte", "intToShort", "intToCharacter",
      "intToLong", "intToFloat", "intToDouble", "IntegerToboolean", "IntegerTochar", "longToboolean", "longToByte",
      "longToShort", "longToCharacter", "longToInteger", "longToFloat", "longToDouble", "LongToboolean",
      "LongTochar", "floatToboolean", "floatToByte", "floatToShort", "floatToCharacter", "floatToInteger",
      "floatToLong", "floatToDouble", "FloatToboolean", "FloatTochar", "doubleToboolean", "doubleToByte",
      "doubleToShort", "doubleToCharacter", "doubleToInteger", "doubleToLong", "doubleToFloat", "DoubleToboolean",
      "DoubleTochar", "StringTochar", "StringToCharacter",
    };

    constexpr std::string_view DynamicTargets[] = {"byte", "short", "char",      "int",     "long", "float", "double",
                                                   "Byte", "Short", "Character", "Integer", "Long", "Float", "Double"};

    struct NumericPrimitive
    {
      std::string_view name;
      Sort sort;
    };

    constexpr NumericPrimitive NumericPrimitives[] = {
        {"byte", Sort::Byte}, {"short", Sort::Short}, {"char", Sort::Char},     {"int", Sort::Int},
        {"long", Sort::Long}, {"float", Sort::Float}, {"double", Sort::Double},
    };

    void AddStructs(Whitelist &w, const StandardOptions &options)
    {
      w.AddStruct("void", ClassIdOf<void>());
      w.AddStruct("boolean", ClassIdOf<bool>());
      w.AddStruct("byte", ClassIdOf<std::int8_t>());
      w.AddStruct("short", ClassIdOf<std::int16_t>());
      w.AddStruct("char", ClassIdOf<char16_t>());
      w.AddStruct("int", ClassIdOf<std::int32_t>());
      w.AddStruct("long", ClassIdOf<std::int64_t>());
      w.AddStruct("float", ClassIdOf<float>());
      w.AddStruct("double", ClassIdOf<double>());

      w.AddStruct("Void", ClassIdOf<Void>());
      w.AddStruct("Boolean", ClassIdOf<Boolean>());
      w.AddStruct("Byte", ClassIdOf<Byte>());
      w.AddStruct("Short", ClassIdOf<Short>());
      w.AddStruct("Character", ClassIdOf<Character>());
      w.AddStruct("Integer", ClassIdOf<Integer>());
      w.AddStruct("Long", ClassIdOf<Long>());
      w.AddStruct("Float", ClassIdOf<Float>());
      w.AddStruct("Double", ClassIdOf<Double>());

      w.AddStruct("Object", ClassIdOf<Object>());
      w.AddStruct("def", ClassIdOf<Object>());
      w.AddStruct("Number", ClassIdOf<Number>());
      w.AddStruct("CharSequence", ClassIdOf<CharSequence>());
      w.AddStruct("String", ClassIdOf<String>());
      w.AddStruct("Math", ClassIdOf<Math>());
      w.AddStruct("Utility", ClassIdOf<Utility>());
      w.AddStruct("Def", ClassIdOf<Def>());

      w.AddStruct("Iterator", ClassIdOf<Iterator>());
      w.AddStruct("Iterator<Object>", ClassIdOf<Iterator>());
      w.AddStruct("Iterator<String>", ClassIdOf<Iterator>());

      w.AddStruct("Collection", ClassIdOf<Collection>());
      w.AddStruct("Collection<Object>", ClassIdOf<Collection>());
      w.AddStruct("Collection<String>", ClassIdOf<Collection>());

      w.AddStruct("List", ClassIdOf<List>());
      w.AddStruct("ArrayList", ClassIdOf<ArrayList>());
      w.AddStruct("List<Object>", ClassIdOf<List>());
      w.AddStruct("ArrayList<Object>", ClassIdOf<ArrayList>());
      w.AddStruct("List<String>", ClassIdOf<List>());
      w.AddStruct("ArrayList<String>", ClassIdOf<ArrayList>());

      w.AddStruct("Set", ClassIdOf<Set>());
      w.AddStruct("HashSet", ClassIdOf<HashSet>());
      w.AddStruct("Set<Object>", ClassIdOf<Set>());
      w.AddStruct("HashSet<Object>", ClassIdOf<HashSet>());
      w.AddStruct("Set<String>", ClassIdOf<Set>());
      w.AddStruct("HashSet<String>", ClassIdOf<HashSet>());

      w.AddStruct("Map", ClassIdOf<Map>());
      w.AddStruct("HashMap", ClassIdOf<HashMap>());
      w.AddStruct("Map<Object,Object>", ClassIdOf<Map>());
      w.AddStruct("HashMap<Object,Object>", ClassIdOf<HashMap>());
      w.AddStruct("Map<String,def>", ClassIdOf<Map>());
      w.AddStruct("HashMap<String,def>", ClassIdOf<HashMap>());
      w.AddStruct("Map<String,Object>", ClassIdOf<Map>());
      w.AddStruct("HashMap<String,Object>", ClassIdOf<HashMap>());

      w.AddStruct("Exception", ClassIdOf<Exception>());
      w.AddStruct("ArithmeticException", ClassIdOf<ArithmeticException>());
      w.AddStruct("IllegalArgumentException", ClassIdOf<IllegalArgumentException>());
      w.AddStruct("IllegalStateException", ClassIdOf<IllegalStateException>());
      w.AddStruct("NumberFormatException", ClassIdOf<NumberFormatException>());

      if (options.includeFeatureTest)
        w.AddStruct("FeatureTest", ClassIdOf<FeatureTest>());
    }

    void AddLangElements(Whitelist &w)
    {
      w.AddMethod("Object", "equals", Instance, "boolean", {"Object"});
      w.AddMethod("Object", "hashCode", Instance, "int", {});
      w.AddMethod("Object", "toString", Instance, "String", {});

      w.AddMethod("def", "equals", Instance, "boolean", {"Object"});
      w.AddMethod("def", "hashCode", Instance, "int", {});
      w.AddMethod("def", "toString", Instance, "String", {});

      w.AddConstructor("Boolean", {"boolean"});
      w.AddMethod("Boolean", "booleanValue", Instance, "boolean", {});
      w.AddMethod("Boolean", "compare", Static, "int", {"boolean", "boolean"});
      w.AddMethod("Boolean", "compareTo", Instance, "int", {"Boolean"});
      w.AddMethod("Boolean", "parseBoolean", Static, "boolean", {"String"});
      w.AddMethod("Boolean", "valueOf", Static, "Boolean", {"boolean"});
      w.AddField("Boolean", "FALSE", Static, "Boolean");
      w.AddField("Boolean", "TRUE", Static, "Boolean");

      w.AddConstructor("Byte", {"byte"});
      w.AddMethod("Byte", "compare", Static, "int", {"byte", "byte"});
      w.AddMethod("Byte", "compareTo", Instance, "int", {"Byte"});
      w.AddMethod("Byte", "parseByte", Static, "byte", {"String"});
      w.AddMethod("Byte", "valueOf", Static, "Byte", {"byte"});
      w.AddField("Byte", "MIN_VALUE", Static, "byte");
      w.AddField("Byte", "MAX_VALUE", Static, "byte");

      w.AddConstructor("Short", {"short"});
      w.AddMethod("Short", "compare", Static, "int", {"short", "short"});
      w.AddMethod("Short", "compareTo", Instance, "int", {"Short"});
      w.AddMethod("Short", "parseShort", Static, "short", {"String"});
      w.AddMethod("Short", "valueOf", Static, "Short", {"short"});
      w.AddField("Short", "MIN_VALUE", Static, "short");
      w.AddField("Short", "MAX_VALUE", Static, "short");

      w.AddConstructor("Character", {"char"});
      w.AddMethod("Character", "charCount", Static, "int", {"int"});
      w.AddMethod("Character", "charValue", Instance, "char", {});
      w.AddMethod("Character", "compare", Static, "int", {"char", "char"});
      w.AddMethod("Character", "compareTo", Instance, "int", {"Character"});
      w.AddMethod("Character", "digit", Static, "int", {"int", "int"});
      w.AddMethod("Character", "forDigit", Static, "char", {"int", "int"});
      w.AddMethod("Character", "getNumericValue", Static, "int", {"int"});
      for (const auto predicate : {"isAlphabetic", "isDefined", "isDigit", "isLetter", "isLetterOrDigit", "isLowerCase",
                                   "isSpaceChar", "isTitleCase", "isUpperCase", "isWhitespace"})
        w.AddMethod("Character", predicate, Static, "boolean", {"int"});
      w.AddMethod("Character", "valueOf", Static, "Character", {"char"});
      w.AddField("Character", "MIN_VALUE", Static, "char");
      w.AddField("Character", "MAX_VALUE", Static, "char");

      w.AddConstructor("Integer", {"int"});
      w.AddMethod("Integer", "compare", Static, "int", {"int", "int"});
      w.AddMethod("Integer", "compareTo", Instance, "int", {"Integer"});
      w.AddMethod("Integer", "min", Static, "int", {"int", "int"});
      w.AddMethod("Integer", "max", Static, "int", {"int", "int"});
      w.AddMethod("Integer", "parseInt", Static, "int", {"String"});
      w.AddMethod("Integer", "signum", Static, "int", {"int"});
      w.AddMethod("Integer", "toHexString", Static, "String", {"int"});
      w.AddMethod("Integer", "valueOf", Static, "Integer", {"int"});
      w.AddField("Integer", "MIN_VALUE", Static, "int");
      w.AddField("Integer", "MAX_VALUE", Static, "int");

      w.AddConstructor("Long", {"long"});
      w.AddMethod("Long", "compare", Static, "int", {"long", "long"});
      w.AddMethod("Long", "compareTo", Instance, "int", {"Long"});
      w.AddMethod("Long", "min", Static, "long", {"long", "long"});
      w.AddMethod("Long", "max", Static, "long", {"long", "long"});
      w.AddMethod("Long", "parseLong", Static, "long", {"String"});
      w.AddMethod("Long", "signum", Static, "int", {"long"});
      w.AddMethod("Long", "toHexString", Static, "String", {"long"});
      w.AddMethod("Long", "valueOf", Static, "Long", {"long"});
      w.AddField("Long", "MIN_VALUE", Static, "long");
      w.AddField("Long", "MAX_VALUE", Static, "long");

      w.AddConstructor("Float", {"float"});
      w.AddMethod("Float", "compare", Static, "int", {"float", "float"});
      w.AddMethod("Float", "compareTo", Instance, "int", {"Float"});
      w.AddMethod("Float", "min", Static, "float", {"float", "float"});
      w.AddMethod("Float", "max", Static, "float", {"float", "float"});
      w.AddMethod("Float", "parseFloat", Static, "float", {"String"});
      w.AddMethod("Float", "toHexString", Static, "String", {"float"});
      w.AddMethod("Float", "valueOf", Static, "Float", {"float"});
      w.AddField("Float", "MIN_VALUE", Static, "float");
      w.AddField("Float", "MAX_VALUE", Static, "float");

      w.AddConstructor("Double", {"double"});
      w.AddMethod("Double", "compare", Static, "int", {"double", "double"});
      w.AddMethod("Double", "compareTo", Instance, "int", {"Double"});
      w.AddMethod("Double", "min", Static, "double", {"double", "double"});
      w.AddMethod("Double", "max", Static, "double", {"double", "double"});
      w.AddMethod("Double", "parseDouble", Static, "double", {"String"});
      w.AddMethod("Double", "toHexString", Static, "String", {"double"});
      w.AddMethod("Double", "valueOf", Static, "Double", {"double"});
      w.AddField("Double", "MIN_VALUE", Static, "double");
      w.AddField("Double", "MAX_VALUE", Static, "double");

      w.AddMethod("Number", "byteValue", Instance, "byte", {});
      w.AddMethod("Number", "shortValue", Instance, "short", {});
      w.AddMethod("Number", "intValue", Instance, "int", {});
      w.AddMethod("Number", "longValue", Instance, "long", {});
      w.AddMethod("Number", "floatValue", Instance, "float", {});
      w.AddMethod("Number", "doubleValue", Instance, "double", {});

      w.AddMethod("CharSequence", "charAt", Instance, "char", {"int"});
      w.AddMethod("CharSequence", "length", Instance, "int", {});

      w.AddConstructor("String", {});
      w.AddMethod("String", "codePointAt", Instance, "int", {"int"});
      w.AddMethod("String", "compareTo", Instance, "int", {"String"});
      w.AddMethod("String", "concat", Instance, "String", {"String"});
      w.AddMethod("String", "endsWith", Instance, "boolean", {"String"});
      w.AddMethod("String", "indexOf", Instance, "int", {"String"});
      w.AddMethod("String", "indexOf", Instance, "int", {"String", "int"});
      w.AddMethod("String", "isEmpty", Instance, "boolean", {});
      w.AddMethod("String", "replace", Instance, "String", {"CharSequence", "CharSequence"});
      w.AddMethod("String", "startsWith", Instance, "boolean", {"String"});
      w.AddMethod("String", "substring", Instance, "String", {"int", "int"});
      w.AddMethod("String", "toCharArray", Instance, "char[]", {});
      w.AddMethod("String", "trim", Instance, "String", {});

      w.AddMethod("Exception", "getMessage", Instance, "String", {});
      w.AddConstructor("ArithmeticException", {"String"});
      w.AddConstructor("IllegalArgumentException", {"String"});
      w.AddConstructor("IllegalStateException", {"String"});
      w.AddConstructor("NumberFormatException", {"String"});
    }

    void AddStaticElements(Whitelist &w)
    {
      for (const auto name : UtilityConversions)
      {
        const auto split = name.find("To");
        w.AddMethod("Utility", name, Static, name.substr(split + 2), {name.substr(0, split)});
      }

      for (const auto name : {"abs", "acos", "asin", "atan", "cbrt", "ceil", "cos", "cosh", "exp", "expm1", "floor",
                              "log", "log10", "log1p", "rint", "sin", "sinh", "sqrt", "tan", "tanh", "toDegrees",
                              "toRadians"})
        w.AddMethod("Math", name, Static, "double", {"double"});
      for (const auto name : {"atan2", "hypot", "max", "min", "pow"})
        w.AddMethod("Math", name, Static, "double", {"double", "double"});
      w.AddMethod("Math", "random", Static, "double", {});
      w.AddMethod("Math", "round", Static, "long", {"double"});
      w.AddField("Math", "E", Static, "double");
      w.AddField("Math", "PI", Static, "double");

      for (const auto suffix : {std::string_view{"Implicit"}, std::string_view{"Explicit"}})
      {
        for (const auto target : DynamicTargets)
        {
          const auto name = std::string{"DefTo"}.append(target).append(suffix);
          w.AddMethod("Def", name, Static, target, {"def"});
        }
      }
    }

    void AddCollectionElements(Whitelist &w)
    {
      w.AddMethod("Iterator", "hasNext", Instance, "boolean", {});
      w.AddMethod("Iterator", "next", {}, Instance, "Object", {}, "def", {});
      w.AddMethod("Iterator", "remove", Instance, "void", {});

      w.AddMethod("Iterator<Object>", "hasNext", Instance, "boolean", {});
      w.AddMethod("Iterator<Object>", "next", Instance, "Object", {});
      w.AddMethod("Iterator<Object>", "remove", Instance, "void", {});

      w.AddMethod("Iterator<String>", "hasNext", Instance, "boolean", {});
      w.AddMethod("Iterator<String>", "next", {}, Instance, "Object", {}, "String", {});
      w.AddMethod("Iterator<String>", "remove", Instance, "void", {});

      // Collection, Collection<Object> and Collection<String> differ only in element and iterator types.
      struct Flavor
      {
        std::string_view collection;
        std::string_view iterator;
        std::string_view element;
      };
      for (const auto &f : {Flavor{"Collection", "Iterator", "def"}, Flavor{"Collection<Object>", "Iterator<Object>", ""},
                            Flavor{"Collection<String>", "Iterator<String>", "String"}})
      {
        const auto takesElement = [&](std::string_view method)
        {
          if (f.element.empty())
            w.AddMethod(f.collection, method, Instance, "boolean", {"Object"});
          else
            w.AddMethod(f.collection, method, {}, Instance, "boolean", {"Object"}, {}, {f.element});
        };
        takesElement("add");
        w.AddMethod(f.collection, "clear", Instance, "void", {});
        takesElement("contains");
        w.AddMethod(f.collection, "isEmpty", Instance, "boolean", {});
        w.AddMethod(f.collection, "iterator", Instance, f.iterator, {});
        takesElement("remove");
        w.AddMethod(f.collection, "size", Instance, "int", {});
      }

      w.AddMethod("List", "set", {}, Instance, "Object", {"int", "Object"}, "def", {"int", "def"});
      w.AddMethod("List", "get", {}, Instance, "Object", {"int"}, "def", {});
      w.AddMethod("List", "remove", {}, Instance, "Object", {"int"}, "def", {});
      w.AddMethod("List", "getLength", "size", Instance, "int", {}, {}, {});
      w.AddConstructor("ArrayList", {});

      w.AddMethod("List<Object>", "set", Instance, "Object", {"int", "Object"});
      w.AddMethod("List<Object>", "get", Instance, "Object", {"int"});
      w.AddMethod("List<Object>", "remove", Instance, "Object", {"int"});
      w.AddMethod("List<Object>", "getLength", "size", Instance, "int", {}, {}, {});
      w.AddConstructor("ArrayList<Object>", {});

      w.AddMethod("List<String>", "set", {}, Instance, "Object", {"int", "Object"}, "String", {"int", "String"});
      w.AddMethod("List<String>", "get", {}, Instance, "Object", {"int"}, "String", {});
      w.AddMethod("List<String>", "remove", {}, Instance, "Object", {"int"}, "String", {});
      w.AddMethod("List<String>", "getLength", "size", Instance, "int", {}, {}, {});
      w.AddConstructor("ArrayList<String>", {});

      w.AddConstructor("HashSet", {});
      w.AddConstructor("HashSet<Object>", {});
      w.AddConstructor("HashSet<String>", {});

      w.AddMethod("Map", "put", {}, Instance, "Object", {"Object", "Object"}, "def", {"def", "def"});
      w.AddMethod("Map", "get", {}, Instance, "Object", {"Object"}, "def", {"def"});
      w.AddMethod("Map", "remove", Instance, "Object", {"Object"});
      w.AddMethod("Map", "isEmpty", Instance, "boolean", {});
      w.AddMethod("Map", "size", Instance, "int", {});
      w.AddMethod("Map", "containsKey", {}, Instance, "boolean", {"Object"}, {}, {"def"});
      w.AddMethod("Map", "containsValue", {}, Instance, "boolean", {"Object"}, {}, {"def"});
      w.AddMethod("Map", "keySet", {}, Instance, "Set<Object>", {}, "Set", {});
      w.AddMethod("Map", "values", {}, Instance, "Collection<Object>", {}, "Collection", {});
      w.AddConstructor("HashMap", {});

      w.AddMethod("Map<Object,Object>", "put", Instance, "Object", {"Object", "Object"});
      w.AddMethod("Map<Object,Object>", "get", Instance, "Object", {"Object"});
      w.AddMethod("Map<Object,Object>", "remove", Instance, "Object", {"Object"});
      w.AddMethod("Map<Object,Object>", "isEmpty", Instance, "boolean", {});
      w.AddMethod("Map<Object,Object>", "size", Instance, "int", {});
      w.AddMethod("Map<Object,Object>", "containsKey", Instance, "boolean", {"Object"});
      w.AddMethod("Map<Object,Object>", "containsValue", Instance, "boolean", {"Object"});
      w.AddMethod("Map<Object,Object>", "keySet", Instance, "Set<Object>", {});
      w.AddMethod("Map<Object,Object>", "values", Instance, "Collection<Object>", {});
      w.AddConstructor("HashMap<Object,Object>", {});

      w.AddMethod("Map<String,def>", "put", {}, Instance, "Object", {"Object", "Object"}, "def", {"String", "def"});
      w.AddMethod("Map<String,def>", "get", {}, Instance, "Object", {"Object"}, "def", {"String"});
      w.AddMethod("Map<String,def>", "remove", {}, Instance, "Object", {"Object"}, "def", {"String"});
      w.AddMethod("Map<String,def>", "isEmpty", Instance, "boolean", {});
      w.AddMethod("Map<String,def>", "size", Instance, "int", {});
      w.AddMethod("Map<String,def>", "containsKey", {}, Instance, "boolean", {"Object"}, {}, {"String"});
      w.AddMethod("Map<String,def>", "containsValue", {}, Instance, "boolean", {"Object"}, {}, {"def"});
      w.AddMethod("Map<String,def>", "keySet", {}, Instance, "Set<Object>", {}, "Set<String>", {});
      w.AddMethod("Map<String,def>", "values", {}, Instance, "Collection<Object>", {}, "Collection", {});
      w.AddConstructor("HashMap<String,def>", {});

      w.AddMethod("Map<String,Object>", "put", {}, Instance, "Object", {"Object", "Object"}, {}, {"String", "Object"});
      w.AddMethod("Map<String,Object>", "get", {}, Instance, "Object", {"Object"}, {}, {"String"});
      w.AddMethod("Map<String,Object>", "remove", {}, Instance, "Object", {"Object"}, {}, {"String"});
      w.AddMethod("Map<String,Object>", "isEmpty", Instance, "boolean", {});
      w.AddMethod("Map<String,Object>", "size", Instance, "int", {});
      w.AddMethod("Map<String,Object>", "containsKey", {}, Instance, "boolean", {"Object"}, {}, {"String"});
      w.AddMethod("Map<String,Object>", "containsValue", Instance, "boolean", {"Object"});
      w.AddMethod("Map<String,Object>", "keySet", {}, Instance, "Set<Object>", {}, "Set<String>", {});
      w.AddMethod("Map<String,Object>", "values", Instance, "Collection<Object>", {});
      w.AddConstructor("HashMap<String,Object>", {});
    }

    void AddFeatureTestElements(Whitelist &w)
    {
      w.AddConstructor("FeatureTest", {});
      w.AddConstructor("FeatureTest", {"int", "int"});
      w.AddMethod("FeatureTest", "getX", Instance, "int", {});
      w.AddMethod("FeatureTest", "getY", Instance, "int", {});
      w.AddMethod("FeatureTest", "setX", Instance, "void", {"int"});
      w.AddMethod("FeatureTest", "setY", Instance, "void", {"int"});
      w.AddMethod("FeatureTest", "overloadedStatic", Static, "boolean", {});
      w.AddMethod("FeatureTest", "overloadedStatic", Static, "boolean", {"boolean"});
    }

    // Parents are listed nearest first; members already present on the owner are kept.
    void CopyStructs(Whitelist &w, const StandardOptions &options)
    {
      w.CopyStruct("Void", {"Object"});
      w.CopyStruct("Boolean", {"Object"});
      w.CopyStruct("Byte", {"Number", "Object"});
      w.CopyStruct("Short", {"Number", "Object"});
      w.CopyStruct("Character", {"Object"});
      w.CopyStruct("Integer", {"Number", "Object"});
      w.CopyStruct("Long", {"Number", "Object"});
      w.CopyStruct("Float", {"Number", "Object"});
      w.CopyStruct("Double", {"Number", "Object"});

      w.CopyStruct("Number", {"Object"});
      w.CopyStruct("CharSequence", {"Object"});
      w.CopyStruct("String", {"CharSequence", "Object"});

      w.CopyStruct("Iterator", {"Object"});
      w.CopyStruct("Iterator<Object>", {"Object"});
      w.CopyStruct("Iterator<String>", {"Object"});
      w.CopyStruct("Collection", {"Object"});
      w.CopyStruct("Collection<Object>", {"Object"});
      w.CopyStruct("Collection<String>", {"Object"});

      w.CopyStruct("List", {"Collection", "Object"});
      w.CopyStruct("ArrayList", {"List", "Collection", "Object"});
      w.CopyStruct("List<Object>", {"Collection<Object>", "Object"});
      w.CopyStruct("ArrayList<Object>", {"List<Object>", "Collection<Object>", "Object"});
      w.CopyStruct("List<String>", {"Collection<String>", "Object"});
      w.CopyStruct("ArrayList<String>", {"List<String>", "Collection<String>", "Object"});

      w.CopyStruct("Set", {"Collection", "Object"});
      w.CopyStruct("HashSet", {"Set", "Collection", "Object"});
      w.CopyStruct("Set<Object>", {"Collection<Object>", "Object"});
      w.CopyStruct("HashSet<Object>", {"Set<Object>", "Collection<Object>", "Object"});
      w.CopyStruct("Set<String>", {"Collection<String>", "Object"});
      w.CopyStruct("HashSet<String>", {"Set<String>", "Collection<String>", "Object"});

      w.CopyStruct("Map", {"Object"});
      w.CopyStruct("HashMap", {"Map", "Object"});
      w.CopyStruct("Map<Object,Object>", {"Object"});
      w.CopyStruct("HashMap<Object,Object>", {"Map<Object,Object>", "Object"});
      w.CopyStruct("Map<String,def>", {"Object"});
      w.CopyStruct("HashMap<String,def>", {"Map<String,def>", "Object"});
      w.CopyStruct("Map<String,Object>", {"Object"});
      w.CopyStruct("HashMap<String,Object>", {"Map<String,Object>", "Object"});

      w.CopyStruct("Exception", {"Object"});
      w.CopyStruct("ArithmeticException", {"Exception", "Object"});
      w.CopyStruct("IllegalArgumentException", {"Exception", "Object"});
      w.CopyStruct("IllegalStateException", {"Exception", "Object"});
      w.CopyStruct("NumberFormatException", {"Exception", "Object"});

      if (options.includeFeatureTest)
        w.CopyStruct("FeatureTest", {"Object"});
    }

    void AddTransforms(Whitelist &w)
    {
      for (const auto &from : NumericPrimitives)
      {
        for (const auto &to : NumericPrimitives)
        {
          if (from.sort != to.sort)
            w.AddTransform(from.name, to.name, !IsWideningConversion(from.sort, to.sort));
        }
      }
      for (const auto &edge : AdapterEdges)
        w.AddTransform(edge.from, edge.to, edge.owner, edge.adapter, edge.isStatic, edge.isExplicit);
    }

    void AddRuntimeClasses(Whitelist &w, const StandardOptions &options)
    {
      for (const auto name : {"boolean", "byte", "short", "char", "int", "long", "float", "double", "Boolean", "Byte",
                              "Short", "Character", "Integer", "Long", "Float", "Double", "Object", "Number",
                              "CharSequence", "String", "Iterator<Object>", "Collection<Object>", "List<Object>",
                              "ArrayList<Object>", "Set<Object>", "HashSet<Object>", "Map<Object,Object>",
                              "HashMap<Object,Object>", "Exception"})
        w.AddRuntimeClass(name);
      if (options.includeFeatureTest)
        w.AddRuntimeClass("FeatureTest");
    }
  } // namespace

  void RegisterStandardHost(HostRegistry &registry)
  {
    registry.RegisterClasses<Object, Void, Number, Boolean, Byte, Short, Character, Integer, Long, Float, Double,
                             CharSequence, String, Math, Utility, Def>();
    registry.RegisterClasses<Iterator, Collection, List, ArrayList, Set, HashSet, Map, HashMap>();
    registry.RegisterClasses<Exception, ArithmeticException, IllegalArgumentException, IllegalStateException,
                             NumberFormatException, FeatureTest>();
  }

  std::expected<std::shared_ptr<const Definition>, Error> BuildStandardDefinition(const StandardOptions &options)
  {
    auto registry = std::make_shared<HostRegistry>();
    RegisterStandardHost(*registry);

    DefinitionBuilder builder{registry, options.definition};
    Whitelist w{builder};
    AddStructs(w, options);
    AddLangElements(w);
    AddStaticElements(w);
    AddCollectionElements(w);
    if (options.includeFeatureTest)
      AddFeatureTestElements(w);
    CopyStructs(w, options);
    AddTransforms(w);
    AddRuntimeClasses(w, options);

    if (auto result = w.Result(); !result)
      return std::unexpected(std::move(result.error()));
    return std::move(builder).Build();
  }

  const std::expected<std::shared_ptr<const Definition>, Error> &StandardDefinition()
  {
    static const auto definition = BuildStandardDefinition();
    return definition;
  }

} // namespace Tessera::Catalog::Standard
