#include <querygraph/sql/sql_generator.hpp>

#include <querygraph/sql/clause_assembler.hpp>
#include <querygraph/sql/from_clause_builder.hpp>

namespace querygraph {

namespace {

GeneratedSql GenerateSelect(const GenerationInput& input) {
    if (input.graph.Empty()) {
        if (input.imported_body.empty()) {
            return GeneratedSql{kEmptyCanvasComment, true};
        }
        return GeneratedSql{input.imported_body, false};
    }

    const auto from = BuildFromClause(input.graph);
    const auto from_text = input.rewriter.Rewrite(from.text).text;
    const auto items = BuildSelectList(input.graph, input.clauses);
    return GeneratedSql{AssembleSelect(items, from_text, input.clauses) +
                            RenderCombineSuffix(input.clauses),
                        false};
}

} // anonymous namespace

GeneratedSql GenerateSql(const GenerationInput& input) {
    auto generated = input.mode == OperationMode::Select
                         ? GenerateSelect(input)
                         : TranslateDml(input.mode, input.graph, input.clauses, input.rewriter);
    if (!generated.diagnostic) {
        generated.text = input.ctes.Apply(generated.text);
    }
    return generated;
}

} // namespace querygraph
