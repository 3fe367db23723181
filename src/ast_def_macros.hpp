#ifndef TWCSS_AST_DEF_MACROS_H
#define TWCSS_AST_DEF_MACROS_H

#ifndef TWCSS_MAX_NESTING
// Deepest rule nesting walked or printed before we
// bail out. Stack size is platform dependent, so the
// value is a conservative guess rather than a limit.
#define TWCSS_MAX_NESTING 512
#endif

// Sets `var` for the current scope and restores it on exit
template <class T>
class LocalOption {
  private:
    T& var;
    T orig;
  public:
    LocalOption(T& var, T cur) :
      var(var), orig(var)
    {
      this->var = cur;
    }
    ~LocalOption() {
      this->var = this->orig;
    }
};

#define LOCAL_COUNT(name,opt) LocalOption<size_t> cnt_##name(name, opt)

#define RECURSION_GUARD(name) \
  LocalOption<size_t> cnt_##name(name, name + 1); \
  if (name > TWCSS_MAX_NESTING) throw Exception::RecursionLimitError(); \

#define ADD_PROPERTY(type, name)\
protected:\
  type name##_;\
public:\
  const type& name() const { return name##_; }\
  void name(type&& name##__) { name##_ = std::move(name##__); }\
  void name(const type& name##__) { name##_ = name##__; }\
private:

#define ADD_REF(type, name) \
protected: \
  type name##_; \
public: \
  type& name() { return name##_; } \
  const type& name() const { return name##_; } \
  void name(type&& name##__) { name##_ = std::move(name##__); } \
  void name(const type& name##__) { name##_ = name##__; } \
private:

// Use by location and range
#define ATTACH_EQ_OPERATIONS(klass) \
  bool operator==(const klass& rhs) const; \
  bool operator!=(const klass& rhs) const { return !(*this == rhs); }; \

// Use by location
#define ATTACH_CMP_OPERATIONS(klass) \
  bool operator<(const klass& rhs) const; \
  bool operator>(const klass& rhs) const { return rhs < *this; }; \
  bool operator<=(const klass& rhs) const { return !(rhs < *this); }; \
  bool operator>=(const klass& rhs) const { return !(*this < rhs); }; \

#define BASE_GET_OPERATIONS(klass) \
  virtual klass* get##klass() { return nullptr; } \
  virtual const klass* get##klass() const { return nullptr; } \

#define FINAL_GET_OPERATIONS(klass) \
  klass* get##klass() override final { return this; } \
  const klass* get##klass() const override final { return this; } \

// Opaque handle conversion for the C functions. Only pass
// pointers to `unwrap` that came out of `wrap` before.
#define DECLARE_CAPI_WRAPPER(klass, strukt) \
  struct strukt* wrap() \
  { \
    return reinterpret_cast<struct strukt*>(this); \
  }; \
  static klass& unwrap(struct strukt* wrapped) \
  { \
    if (wrapped == nullptr) throw std::runtime_error( \
      "Null-Pointer passed to " #klass "::unwrap"); \
    return *reinterpret_cast<klass*>(wrapped); \
  }; \

#endif
