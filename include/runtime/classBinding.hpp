#pragma once

#include "runtime/object.hpp"
#include "runtime/scriptError.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace snap {

/**
 * @brief Exposes a host C++ type to scripts and to the debugger
 *
 * Registration stands in for runtime reflection: each field or property
 * handed to the binding becomes a member of the wrapped object.
 *
 *   ClassBinding<Point> binding("Point");
 *   binding.field("x", &Point::x).property("norm", [](const Point &p) {...});
 *   Value v = binding.wrap(std::make_shared<Point>());
 */
template <typename T> class ClassBinding {
public:
  using Getter = std::function<Value(const T &)>;

  explicit ClassBinding(std::string typeName,
                        ObjectKind kind = ObjectKind::Class)
      : descriptor(std::make_shared<Descriptor>()) {
    descriptor->typeName = std::move(typeName);
    descriptor->kind = kind;
  }

  template <typename M>
  ClassBinding &field(const std::string &name, M T::*member,
                      bool nonPublic = false) {
    descriptor->entries.push_back(
        {{name, false, nonPublic},
         [member](const T &self) { return Value(self.*member); }});
    return *this;
  }

  ClassBinding &property(const std::string &name, Getter getter,
                         bool nonPublic = false) {
    descriptor->entries.push_back({{name, true, nonPublic}, std::move(getter)});
    return *this;
  }

  Value wrap(std::shared_ptr<T> instance) const {
    return Value(std::make_shared<Bound>(descriptor, std::move(instance)));
  }

private:
  struct Entry {
    MemberInfo info;
    Getter getter;
  };

  struct Descriptor {
    std::string typeName;
    ObjectKind kind{ObjectKind::Class};
    std::vector<Entry> entries;
  };

  class Bound : public Object {
  public:
    Bound(std::shared_ptr<const Descriptor> descriptor,
          std::shared_ptr<T> instance)
        : descriptor(std::move(descriptor)), instance(std::move(instance)) {}

    std::string typeName() const override { return descriptor->typeName; }
    ObjectKind kind() const override { return descriptor->kind; }

    std::vector<MemberInfo> members() const override {
      std::vector<MemberInfo> result;
      for (const auto &entry : descriptor->entries) {
        result.push_back(entry.info);
      }
      return result;
    }

    Value getMember(const std::string &name, bool isProperty) const override {
      for (const auto &entry : descriptor->entries) {
        if (entry.info.name == name && entry.info.isProperty == isProperty) {
          return entry.getter(*instance);
        }
      }
      return Object::getMember(name, isProperty);
    }

  private:
    std::shared_ptr<const Descriptor> descriptor;
    std::shared_ptr<T> instance;
  };

  std::shared_ptr<Descriptor> descriptor;
};

} // namespace snap
