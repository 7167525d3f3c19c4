// tests/unit/sema/test_symbol_table.cpp - SymbolTable and subtype queries

#include <gtest/gtest.h>

#include <string>

#include "assert_lint/sema/symbols/symbol_table.hpp"

using namespace assert_lint;

TEST(SymbolTable, TypesAreCreatedOnce)
{
  SymbolTable table;
  TypeSymbol & a = table.get_or_create_type("a.A");
  TypeSymbol & again = table.get_or_create_type("a.A");

  EXPECT_EQ(&a, &again);
  EXPECT_EQ(table.type_count(), 1U);
  EXPECT_EQ(table.find_type("a.A"), &a);
  EXPECT_EQ(table.find_type("a.B"), nullptr);
}

TEST(SymbolTable, AddressesStayStable)
{
  SymbolTable table;
  const TypeSymbol * first = &table.get_or_create_type("T0");
  for (int i = 1; i < 1000; ++i) {
    (void)table.get_or_create_type("T" + std::to_string(i));
  }
  EXPECT_EQ(table.find_type("T0"), first);
}

TEST(SymbolTable, DuplicateMethodIdIsRejected)
{
  SymbolTable table;
  MethodSymbol m;
  m.name = "run";

  MethodSymbol * stored = table.define_method("T#run", m);
  ASSERT_NE(stored, nullptr);
  EXPECT_EQ(stored->id, "T#run");
  EXPECT_EQ(table.define_method("T#run", m), nullptr);
  EXPECT_EQ(table.method_count(), 1U);
  EXPECT_EQ(table.find_method("T#run"), stored);
  EXPECT_EQ(table.find_method("T#other"), nullptr);
}

TEST(TypeSymbol, SubtypeIsReflexiveAndTransitive)
{
  SymbolTable table;
  TypeSymbol & base = table.get_or_create_type("Base");
  TypeSymbol & mid = table.get_or_create_type("Mid");
  TypeSymbol & iface = table.get_or_create_type("Iface");
  TypeSymbol & leaf = table.get_or_create_type("Leaf");
  mid.supertypes.push_back(&base);
  leaf.supertypes.push_back(&mid);
  leaf.supertypes.push_back(&iface);

  EXPECT_TRUE(leaf.is_subtype_of("Leaf"));
  EXPECT_TRUE(leaf.is_subtype_of("Mid"));
  EXPECT_TRUE(leaf.is_subtype_of("Base"));
  EXPECT_TRUE(leaf.is_subtype_of("Iface"));
  EXPECT_FALSE(base.is_subtype_of("Leaf"));
  EXPECT_FALSE(leaf.is_subtype_of("Unknown"));
}

TEST(TypeSymbol, CyclicHierarchyTerminates)
{
  SymbolTable table;
  TypeSymbol & a = table.get_or_create_type("A");
  TypeSymbol & b = table.get_or_create_type("B");
  a.supertypes.push_back(&b);
  b.supertypes.push_back(&a);

  EXPECT_TRUE(a.is_subtype_of("B"));
  EXPECT_FALSE(a.is_subtype_of("C"));
}

TEST(MethodSymbol, Annotations)
{
  MethodSymbol m;
  Annotation test;
  test.type = "org.junit.Test";
  test.values.push_back(AnnotationValue{"expected", "X.class"});
  m.annotations.push_back(test);
  m.annotations.push_back(Annotation{"java.lang.Deprecated", {}});

  EXPECT_TRUE(m.is_annotated_with("org.junit.Test"));
  EXPECT_FALSE(m.is_annotated_with("org.junit.Ignore"));

  const auto * values = m.values_for_annotation("org.junit.Test");
  ASSERT_NE(values, nullptr);
  ASSERT_EQ(values->size(), 1U);
  EXPECT_EQ(values->front().name, "expected");

  const auto * none = m.values_for_annotation("java.lang.Deprecated");
  ASSERT_NE(none, nullptr);
  EXPECT_TRUE(none->empty());
}
