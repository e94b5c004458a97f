// main.cpp - Record Patch Example

#include <record_patch/diff.h>
#include <record_patch/errors.h>
#include <record_patch/patch.h>
#include <record_patch/record_types.h>
#include <record_patch/value.h>

#include <immer/vector.hpp>
#include <lager/store.hpp>
#include <lager/event_loop/manual.hpp>

#include <iostream>
#include <string>
#include <variant>

using namespace record_patch;

// ============================================================
// Record Types
// ============================================================

const char* const kOrderTypes = R"json(
{
  "recordTypes": {
    "Order": {
      "properties": {
        "id":       { "valueType": "number", "role": "id" },
        "version":  { "valueType": "number", "recordMeta": true },
        "status":   { "valueType": "string" },
        "placedOn": { "valueType": "datetime", "optional": true },
        "tags":     { "valueType": "string[]", "optional": true },
        "notes":    { "valueType": "string{}", "optional": true },
        "customer": { "valueType": "ref(Customer)" },
        "shipTo": {
          "valueType": "object",
          "optional": true,
          "properties": {
            "street": { "valueType": "string" },
            "city":   { "valueType": "string" }
          }
        },
        "items": {
          "valueType": "object[]",
          "properties": {
            "id":       { "valueType": "number", "role": "id" },
            "product":  { "valueType": "string" },
            "quantity": { "valueType": "number" }
          }
        }
      }
    },
    "Customer": {
      "properties": {
        "id": { "valueType": "number", "role": "id" }
      }
    }
  }
}
)json";

// ============================================================
// Application State and Actions
// ============================================================

struct ApplyPatch
{
    std::string json_text;
};

struct ApplyMergePatch
{
    std::string json_text;
};

struct Undo {};
struct Redo {};

using Action = std::variant<ApplyPatch, ApplyMergePatch, Undo, Redo>;

struct AppState
{
    Value order;
    immer::vector<Value> history;
    immer::vector<Value> future;
};

const RecordTypesLibrary& order_types()
{
    static const RecordTypesLibrary types = RecordTypesLibrary::from_json(kOrderTypes);
    return types;
}

AppState create_initial_state()
{
    std::string error;
    Value order = from_json(R"json({
        "id": 1001,
        "version": 1,
        "status": "NEW",
        "customer": "Customer#7",
        "tags": ["web"],
        "items": [
            { "id": 1, "product": "kettle", "quantity": 1 },
            { "id": 2, "product": "teapot", "quantity": 2 }
        ]
    })json", &error);
    if (!error.empty()) {
        throw SyntaxError("Invalid initial order: " + error);
    }

    return AppState{
        .order   = std::move(order),
        .history = immer::vector<Value>{},
        .future  = immer::vector<Value>{}
    };
}

// ============================================================
// Reducer
// ============================================================

PatchHandlers print_handlers()
{
    PatchHandlers handlers;
    handlers.on_insert = [](OpKind kind, const Pointer& ptr, const Value& value, const std::optional<Value>&) {
        std::cout << "  [" << op_kind_name(kind) << "] inserted " << ptr.to_string() << " = " << to_json(value) << "\n";
    };
    handlers.on_remove = [](OpKind kind, const Pointer& ptr, const Value& old_value) {
        std::cout << "  [" << op_kind_name(kind) << "] removed " << ptr.to_string() << " (was " << to_json(old_value) << ")\n";
    };
    handlers.on_set = [](OpKind kind, const Pointer& ptr, const Value& value, const std::optional<Value>&) {
        std::cout << "  [" << op_kind_name(kind) << "] set " << ptr.to_string() << " = " << to_json(value) << "\n";
    };
    handlers.on_test = [](const Pointer& ptr, const Value&, bool passed) {
        std::cout << "  [test] " << ptr.to_string() << (passed ? " passed" : " FAILED") << "\n";
    };
    return handlers;
}

/// Apply to a copy; the state changes only if every operation succeeded
AppState apply_to_state(AppState state, const Patch& patch)
{
    Value working = state.order;
    if (!patch.apply(working, print_handlers())) {
        std::cout << "Patch not applied: a test operation failed.\n";
        return state;
    }

    state.history = state.history.push_back(state.order);
    state.future  = immer::vector<Value>{};
    state.order   = std::move(working);
    return state;
}

AppState reducer(AppState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> AppState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Undo>) {
                if (state.history.empty())
                    return state;

                auto new_state = state;
                new_state.future  = new_state.future.push_back(new_state.order);
                new_state.order   = new_state.history.back();
                new_state.history = new_state.history.take(new_state.history.size() - 1);
                return new_state;

            } else if constexpr (std::is_same_v<T, Redo>) {
                if (state.future.empty())
                    return state;

                auto new_state = state;
                new_state.history = new_state.history.push_back(new_state.order);
                new_state.order   = new_state.future.back();
                new_state.future  = new_state.future.take(new_state.future.size() - 1);
                return new_state;

            } else {
                try {
                    if constexpr (std::is_same_v<T, ApplyPatch>) {
                        return apply_to_state(state, build_patch_from_json(order_types(), "Order", act.json_text));
                    } else {
                        std::string error;
                        Value merge = from_json(act.json_text, &error);
                        if (!error.empty()) {
                            throw SyntaxError("Invalid merge patch JSON: " + error);
                        }
                        return apply_to_state(state, build_merge_patch(order_types(), "Order", merge));
                    }
                } catch (const PatchError& e) {
                    std::cout << "Error: " << e.what() << "\n";
                    return state;
                }
            }
        },
        action);
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(
        create_initial_state(),
        loop,
        lager::with_reducer(reducer)
    );

    std::cout << "=== Record Patch Example ===\n";
    std::cout << "Editing an Order record with JSON Patch and Merge Patch\n\n";

    while (true) {
        std::cout << "Current order:\n";
        print_value(store.get().order, "", 1);

        std::cout << "\n=== Operations ===\n";
        std::cout << "P. Apply JSON Patch (one line)\n";
        std::cout << "M. Apply Merge Patch (one line)\n";
        std::cout << "D. Diff against previous version\n";
        std::cout << "U. Undo\n";
        std::cout << "R. Redo\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice)) {
            return 0;
        }
        std::cin.ignore();

        switch (choice) {
        case 'P':
        case 'p': {
            std::cout << R"(e.g. [{"op":"add","path":"/tags/-","value":"gift"}])" << "\n> ";
            std::string text;
            std::getline(std::cin, text);
            store.dispatch(ApplyPatch{text});
            break;
        }
        case 'M':
        case 'm': {
            std::cout << R"(e.g. {"status":"SHIPPED","shipTo":{"street":"1 Main St","city":"Springfield"}})" << "\n> ";
            std::string text;
            std::getline(std::cin, text);
            store.dispatch(ApplyMergePatch{text});
            break;
        }
        case 'D':
        case 'd': {
            const auto& state = store.get();
            if (state.history.empty()) {
                std::cout << "No previous version.\n";
                break;
            }
            try {
                Value spec = diff_records(order_types(), "Order", state.history.back(), state.order);
                std::cout << to_json(spec) << "\n";
            } catch (const PatchError& e) {
                std::cout << "Error: " << e.what() << "\n";
            }
            break;
        }
        case 'U':
        case 'u':
            store.dispatch(Undo{});
            break;
        case 'R':
        case 'r':
            store.dispatch(Redo{});
            break;
        case 'Q':
        case 'q':
            std::cout << "Goodbye!\n";
            return 0;
        default:
            std::cout << "Invalid choice!\n";
        }

        std::cout << "\n";
    }
}
