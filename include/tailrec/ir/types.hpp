#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/LLVMContext.h>

#include "tailrec/edn.hpp"

namespace tailrec::ir {

// Raised inside lowering; the emitter turns it into a diagnostic for the enclosing function.
struct ir_error : std::runtime_error {
    ir_error(std::string code, const std::string& msg, node_ptr at, std::string hint = {})
        : std::runtime_error(msg), code(std::move(code)), hint(std::move(hint)), at(std::move(at)) {}
    std::string code;
    std::string hint;
    node_ptr at;
};

struct EnumDef;
struct Type;
using TypePtr = std::shared_ptr<const Type>;

// Semantic types of the function language. Param only occurs inside enum variant templates.
struct Type {
    enum class Kind { Int, Bool, Tuple, Enum, Param };
    Kind kind = Kind::Int;
    std::vector<TypePtr> args;    // tuple elements or enum type arguments
    const EnumDef* def = nullptr; // Enum
    int index = -1;               // Param
};

TypePtr int_type();
TypePtr bool_type();
TypePtr unit_type();
TypePtr tuple_type(std::vector<TypePtr> elems);
TypePtr enum_type(const EnumDef* def, std::vector<TypePtr> args);
TypePtr param_type(int index);

inline bool is_unit(const TypePtr& t){ return t && t->kind == Type::Kind::Tuple && t->args.empty(); }
bool same_type(const TypePtr& a, const TypePtr& b);
bool has_params(const TypePtr& t);
// Source-like rendering: Int, (Int, Bool), Action<(Int, Int), Int>
std::string describe(const TypePtr& t);

// Replace Param(i) with args[i].
TypePtr substitute(const TypePtr& t, const std::vector<TypePtr>& args);
// Bind the Params of `templ` against a concrete type; false on a shape or binding conflict.
bool unify(const TypePtr& templ, const TypePtr& concrete, std::vector<TypePtr>& bound);

struct EnumDef {
    struct Variant { std::string name; std::vector<TypePtr> fields; };
    int id = 0;
    std::string name;
    std::vector<std::string> generics;
    std::vector<Variant> variants;
    node_ptr origin;

    int variant_index(const std::string& v) const {
        for(size_t i=0;i<variants.size();++i) if(variants[i].name == v) return (int)i;
        return -1;
    }
};

// LLVM shapes: Int -> i64, Bool -> i1, tuples -> literal structs,
// enums -> named { i32 tag, <fields of variant 0>, <fields of variant 1>, ... } per instantiation.
class TypeLowering {
public:
    explicit TypeLowering(llvm::LLVMContext& ctx) : ctx_(ctx) {}
    llvm::Type* lower(const TypePtr& t);
    // Field types of `variant` in an enum instantiation.
    const std::vector<TypePtr>& variant_fields(const TypePtr& enum_ty, int variant);
    // Struct element index of field k of `variant`.
    unsigned field_index(const TypePtr& enum_ty, int variant, size_t k);
private:
    struct EnumLayout {
        llvm::StructType* st = nullptr;
        std::vector<std::vector<TypePtr>> fields;
        std::vector<unsigned> first;
    };
    EnumLayout& layout(const TypePtr& t);
    static std::string key(const TypePtr& t);

    llvm::LLVMContext& ctx_;
    std::unordered_map<std::string, EnumLayout> enums_;
    std::unordered_set<std::string> in_progress_;
};

} // namespace tailrec::ir
