#include "support/test_modules.hpp"

namespace bastion::test_support {

AccountAddress make_address(byte last) {
    AccountAddress address{};
    address.back() = last;
    return address;
}

ModuleHandleIndex add_import(CompiledModule& module, std::string name, byte address) {
    auto name_id = module.identifiers().push_back(std::move(name));
    return module.module_handles().push_back(ModuleHandle{make_address(address), name_id});
}

StructDefinition
declared_struct(StructHandleIndex handle, std::initializer_list<IdentifierIndex> field_names) {
    std::vector<FieldDefinition> fields;
    for (auto name : field_names)
        fields.push_back(FieldDefinition{name, SignatureToken::make_u64()});
    return StructDefinition{handle, StructFieldInformation::make_declared(std::move(fields))};
}

FunctionDefinition
simple_function(FunctionHandleIndex handle, std::initializer_list<StructDefinitionIndex> acquires) {
    FunctionDefinition def;
    def.function = handle;
    def.is_public = true;
    def.acquires_global_resources.assign(acquires.begin(), acquires.end());
    def.code = CodeUnit{SignatureIndex(0), {0x01}};
    return def;
}

MinimalModule minimal_module() {
    MinimalModule result;
    auto& mod = result.module;

    result.module_name = mod.identifiers().push_back("M");
    result.struct_name = mod.identifiers().push_back("S");
    result.function_name = mod.identifiers().push_back("f");
    result.field_name = mod.identifiers().push_back("x");

    result.empty_signature = mod.signatures().push_back(Signature());

    result.self = mod.module_handles().push_back(ModuleHandle{make_address(1), result.module_name});
    mod.self_handle(result.self);

    result.struct_handle = mod.struct_handles().push_back(
        StructHandle{result.self, result.struct_name, false, {}});
    result.function_handle = mod.function_handles().push_back(FunctionHandle{
        result.self, result.function_name, result.empty_signature, result.empty_signature, {}});

    result.struct_def = mod.struct_defs().push_back(
        declared_struct(result.struct_handle, {result.field_name}));
    result.function_def = mod.function_defs().push_back(simple_function(result.function_handle));
    return result;
}

} // namespace bastion::test_support
