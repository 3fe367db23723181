#ifndef TWCSS_MEMORY_SHARED_PTR_H
#define TWCSS_MEMORY_SHARED_PTR_H

#include "allocator.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

namespace Twcss {

  class SharedPtr;

  // Single hook for all node allocations
  #define TWCSS_MEMORY_NEW(Class, ...) \
    (new Class(__VA_ARGS__)) \

  // Base of everything held by a `SharedImpl`. The counter lives
  // in the object itself, so a raw pointer handed out to C can be
  // adopted by another handle later without a second control block.
  // Objects start with a count of zero until the first handle.
  class SharedObj {

   public:
    SharedObj() : refcount(0) {}
    virtual ~SharedObj() {}

    // Short description for diagnostics
    virtual tw::string to_string() const = 0;

    // Number of handles currently owning this object
    uint32_t getRefCount() const { return refcount; }

   protected:
    friend class SharedPtr;
    uint32_t refcount;
  };

  // Untyped handle doing the actual counting
  class SharedPtr {

  public:
    SharedPtr() : node(nullptr) {}
    SharedPtr(SharedObj* ptr) : node(ptr) { acquire(node); }
    SharedPtr(const SharedPtr& obj) : SharedPtr(obj.node) {}
    SharedPtr(SharedPtr&& obj) : node(obj.node) {
      obj.node = nullptr;
    }
    ~SharedPtr() { release(node); }

    SharedPtr& operator=(SharedObj* other) {
      if (node != other) {
        // the old object may be the only owner of the new one
        SharedObj* old = node;
        node = other;
        acquire(node);
        release(old);
      }
      return *this;
    }

    SharedPtr& operator=(const SharedPtr& obj) {
      return *this = obj.node;
    }

    SharedPtr& operator=(SharedPtr&& obj) {
      if (this != &obj) {
        SharedObj* old = node;
        node = obj.node;
        obj.node = nullptr;
        release(old);
      }
      return *this;
    }

    SharedObj* obj() const { return node; }

  protected:
    SharedObj* node;
    static void acquire(SharedObj* ptr) {
      if (ptr != nullptr) ++ptr->refcount;
    }
    static void release(SharedObj* ptr) {
      if (ptr == nullptr) return;
      if (--ptr->refcount == 0) delete ptr;
    }
  };

  // Typed owning handle, e.g. `AstNodeObj`
  template <class T>
  class SharedImpl : private SharedPtr {

  public:
    SharedImpl() : SharedPtr(nullptr) {}

    template <class U>
    SharedImpl(U* node) :
      SharedPtr(static_cast<T*>(node)) {}

    template <class U>
    SharedImpl(const SharedImpl<U>& impl) :
      SharedImpl(impl.ptr()) {}

    SharedImpl(const SharedImpl<T>& impl) :
      SharedPtr(impl) {}

    SharedImpl(SharedImpl<T>&& impl) :
      SharedPtr(std::move(impl)) {}

    template <class U>
    SharedImpl<T>& operator=(const SharedImpl<U>& rhs) {
      SharedPtr::operator=(static_cast<T*>(rhs.ptr()));
      return *this;
    }

    SharedImpl<T>& operator=(const SharedImpl<T>& rhs) {
      SharedPtr::operator=(rhs);
      return *this;
    }

    SharedImpl<T>& operator=(SharedImpl<T>&& rhs) {
      SharedPtr::operator=(std::move(rhs));
      return *this;
    }

    T& operator*() const { return *ptr(); }
    T* operator->() const { return ptr(); }
    T* ptr() const { return static_cast<T*>(obj()); }
  };

}

#endif
