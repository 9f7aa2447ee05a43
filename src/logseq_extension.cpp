#define DUCKDB_EXTENSION_MAIN

#include "logseq_extension.hpp"
#include "logseq_block_parser.hpp"
#include "logseq_frontmatter.hpp"
#include "logseq_serializer.hpp"
#include "logseq_title.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/common/types/vector.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/extension_helper.hpp"

#include <algorithm>
#include <mutex>

namespace duckdb {

static Value DiagnosticsToValue(const vector<string> &diagnostics) {
	vector<Value> values;
	values.reserve(diagnostics.size());
	for (auto &diagnostic : diagnostics) {
		values.emplace_back(diagnostic);
	}
	return Value::LIST(LogicalType::VARCHAR, std::move(values));
}

static string PagePropertiesJson(const ParsedDocument &doc) {
	PropertyMap properties = doc.properties;
	properties.NormalizeListProperties();
	return properties.ToJson();
}

//===--------------------------------------------------------------------===//
// Scalar functions
//===--------------------------------------------------------------------===//

static LogicalType ParseResultType() {
	child_list_t<LogicalType> fields;
	fields.emplace_back("properties", LogicalType::JSON());
	fields.emplace_back("blocks", LogicalType::JSON());
	fields.emplace_back("diagnostics", LogicalType::LIST(LogicalType::VARCHAR));
	return LogicalType::STRUCT(std::move(fields));
}

static void LogseqParseFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &content_vector = args.data[0];
	auto &entries = StructVector::GetEntries(result);
	auto properties_data = FlatVector::GetData<string_t>(*entries[0]);
	auto blocks_data = FlatVector::GetData<string_t>(*entries[1]);

	for (idx_t i = 0; i < args.size(); i++) {
		Value content = content_vector.GetValue(i);
		if (content.IsNull()) {
			FlatVector::SetNull(result, i, true);
			continue;
		}
		auto doc = ParseDocument(StringValue::Get(content));
		properties_data[i] = StringVector::AddString(*entries[0], doc.properties.ToJson());
		blocks_data[i] = StringVector::AddString(*entries[1], BlocksToJson(doc.blocks));
		entries[2]->SetValue(i, DiagnosticsToValue(doc.diagnostics));
	}
}

static void LogseqBlocksFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t content) {
		auto doc = ParseDocument(content.GetString());
		return StringVector::AddString(result, BlocksToJson(doc.blocks));
	});
}

static void LogseqFrontmatterFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t content) {
		string text = content.GetString();
		auto fm = ParseFrontmatter(text);
		return StringVector::AddString(result, fm ? fm->properties.ToJson() : string("{}"));
	});
}

static LogicalType BlockRowType() {
	child_list_t<LogicalType> fields;
	fields.emplace_back("block_id", LogicalType::BIGINT);
	fields.emplace_back("parent_id", LogicalType::BIGINT);
	fields.emplace_back("depth", LogicalType::INTEGER);
	fields.emplace_back("position", LogicalType::INTEGER);
	fields.emplace_back("block_type", LogicalType::VARCHAR);
	fields.emplace_back("content", LogicalType::VARCHAR);
	return LogicalType::STRUCT(std::move(fields));
}

static void LogseqBlockRowsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &content_vector = args.data[0];
	auto row_type = BlockRowType();

	for (idx_t i = 0; i < args.size(); i++) {
		Value content = content_vector.GetValue(i);
		if (content.IsNull()) {
			result.SetValue(i, Value());
			continue;
		}
		auto doc = ParseDocument(StringValue::Get(content));
		auto rows = FlattenBlocks(doc.blocks);

		vector<Value> row_values;
		row_values.reserve(rows.size());
		for (auto &row : rows) {
			child_list_t<Value> fields;
			fields.emplace_back("block_id", Value::BIGINT(int64_t(row.block_id)));
			fields.emplace_back("parent_id", Value::BIGINT(row.parent_id));
			fields.emplace_back("depth", Value::INTEGER(int32_t(row.depth)));
			fields.emplace_back("position", Value::INTEGER(int32_t(row.position)));
			fields.emplace_back("block_type", Value(BlockTypeToString(row.type)));
			fields.emplace_back("content", Value(row.content));
			row_values.push_back(Value::STRUCT(std::move(fields)));
		}
		result.SetValue(i, Value::LIST(row_type, std::move(row_values)));
	}
}

// NULL on either side counts as an empty property map.
static void LogseqMergePropertiesFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &frontmatter_vector = args.data[0];
	auto &explicit_vector = args.data[1];
	auto result_data = FlatVector::GetData<string_t>(result);

	for (idx_t i = 0; i < args.size(); i++) {
		Value frontmatter = frontmatter_vector.GetValue(i);
		Value explicit_properties = explicit_vector.GetValue(i);

		auto merged = MergeProperties(
		    PropertyMap::FromJson(frontmatter.IsNull() ? string() : StringValue::Get(frontmatter)),
		    PropertyMap::FromJson(explicit_properties.IsNull() ? string() : StringValue::Get(explicit_properties)));
		merged.NormalizeListProperties();
		result_data[i] = StringVector::AddString(result, merged.ToJson());
	}
}

static void LogseqOutlineFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t blocks_json) {
		auto blocks = BlocksFromJson(blocks_json.GetString());
		return StringVector::AddString(result, FormatBlockTree(blocks));
	});
}

static void LogseqOutlineDepthFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	BinaryExecutor::Execute<string_t, int32_t, string_t>(
	    args.data[0], args.data[1], result, args.size(), [&](string_t blocks_json, int32_t max_depth) {
		    if (max_depth < -1) {
			    throw InvalidInputException("logseq_outline: max_depth must be -1 (unlimited) or >= 0, got %d",
			                                max_depth);
		    }
		    auto blocks = BlocksFromJson(blocks_json.GetString());
		    return StringVector::AddString(result, FormatBlockTree(blocks, max_depth));
	    });
}

//===--------------------------------------------------------------------===//
// logseq_pages table function
//===--------------------------------------------------------------------===//

// Directory holding a graph's config.edn and custom files; never scanned for pages.
static constexpr const char *LOGSEQ_CONFIG_DIR = "logseq";

struct LogseqPagesScanData : public TableFunctionData {
	string graph_path;
	string title_property;
	vector<string> files;
};

struct LogseqPagesScanState : public GlobalTableFunctionState {
	std::mutex lock;
	idx_t position = 0;
	idx_t max_threads;

	explicit LogseqPagesScanState(idx_t max_threads_p) : max_threads(max_threads_p) {
	}

	idx_t MaxThreads() const override {
		return max_threads;
	}
};

// Work is handed out through the global position counter; nothing is tracked per thread.
struct LogseqPagesLocalState : public LocalTableFunctionState {};

static void CollectMarkdownFiles(FileSystem &fs, const string &dir, bool graph_root, vector<string> &files) {
	fs.ListFiles(dir, [&](const string &name, bool is_dir) {
		// Skip hidden directories (e.g. .git, .recycle)
		if (!name.empty() && name[0] == '.') {
			return;
		}
		string full_path = fs.JoinPath(dir, name);
		if (is_dir) {
			if (graph_root && name == LOGSEQ_CONFIG_DIR) {
				return;
			}
			CollectMarkdownFiles(fs, full_path, false, files);
		} else if (name.size() > 3 && name.compare(name.size() - 3, 3, ".md") == 0) {
			files.push_back(full_path);
		}
	});
}

static string ReadFileContents(FileSystem &fs, const string &path) {
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ);
	auto file_size = fs.GetFileSize(*handle);
	string contents(file_size, '\0');
	if (file_size > 0) {
		fs.Read(*handle, &contents[0], file_size);
	}
	return contents;
}

// Resolve title: frontmatter <title_property> > first H1 heading > filename stem.
static string ResolveTitle(const string &filename_stem, const ParsedDocument &doc, const string &title_property,
                           const string &contents) {
	string title = doc.properties.GetString(title_property);
	if (!title.empty()) {
		return title;
	}

	string heading = FirstHeadingText(contents.c_str() + doc.body_offset, contents.size() - doc.body_offset);
	if (!heading.empty()) {
		return heading;
	}

	return filename_stem;
}

static unique_ptr<FunctionData> LogseqPagesBind(ClientContext &context, TableFunctionBindInput &input,
                                                vector<LogicalType> &return_types, vector<string> &names) {
	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException("logseq_pages requires a graph path argument");
	}

	auto result = make_uniq<LogseqPagesScanData>();
	result->graph_path = input.inputs[0].GetValue<string>();
	result->title_property = "title";
	auto it = input.named_parameters.find("title_property");
	if (it != input.named_parameters.end() && !it->second.IsNull()) {
		result->title_property = it->second.GetValue<string>();
	}

	auto &fs = FileSystem::GetFileSystem(context);
	if (!fs.DirectoryExists(result->graph_path)) {
		throw IOException("Graph path does not exist: " + result->graph_path);
	}

	string config_dir = fs.JoinPath(result->graph_path, LOGSEQ_CONFIG_DIR);
	if (!fs.DirectoryExists(config_dir)) {
		throw IOException("Path is not a Logseq graph (missing logseq directory): " + result->graph_path);
	}

	CollectMarkdownFiles(fs, result->graph_path, true, result->files);
	// ListFiles order is platform dependent
	std::sort(result->files.begin(), result->files.end());

	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("filename");
	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("filepath");
	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("relative_path");
	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("title");
	return_types.emplace_back(LogicalType::JSON());
	names.emplace_back("properties");
	return_types.emplace_back(LogicalType::JSON());
	names.emplace_back("blocks");
	return_types.emplace_back(LogicalType::BIGINT);
	names.emplace_back("block_count");
	return_types.emplace_back(LogicalType::LIST(LogicalType::VARCHAR));
	names.emplace_back("diagnostics");

	return std::move(result);
}

static unique_ptr<GlobalTableFunctionState> LogseqPagesInitGlobal(ClientContext &context,
                                                                  TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<LogseqPagesScanData>();
	// One thread per file at most; DuckDB caps this at the thread-pool size.
	idx_t max_threads = bind_data.files.empty() ? 1 : bind_data.files.size();
	return make_uniq<LogseqPagesScanState>(max_threads);
}

static unique_ptr<LocalTableFunctionState> LogseqPagesInitLocal(ExecutionContext &context,
                                                                TableFunctionInitInput &input,
                                                                GlobalTableFunctionState *global_state) {
	return make_uniq<LogseqPagesLocalState>();
}

static void LogseqPagesFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<LogseqPagesScanData>();
	auto &gstate = data_p.global_state->Cast<LogseqPagesScanState>();
	auto &fs = FileSystem::GetFileSystem(context);

	// Claim the next batch of files; the lock is released before any I/O or parsing.
	idx_t batch_start, batch_end;
	{
		std::lock_guard<std::mutex> guard(gstate.lock);
		batch_start = gstate.position;
		batch_end = std::min(gstate.position + STANDARD_VECTOR_SIZE, (idx_t)bind_data.files.size());
		gstate.position = batch_end;
	}

	if (batch_start >= batch_end) {
		output.SetCardinality(0);
		return;
	}

	auto filename_data = FlatVector::GetData<string_t>(output.data[0]);
	auto filepath_data = FlatVector::GetData<string_t>(output.data[1]);
	auto relpath_data = FlatVector::GetData<string_t>(output.data[2]);
	auto title_data = FlatVector::GetData<string_t>(output.data[3]);
	auto props_data = FlatVector::GetData<string_t>(output.data[4]);
	auto blocks_data = FlatVector::GetData<string_t>(output.data[5]);
	auto count_data = FlatVector::GetData<int64_t>(output.data[6]);

	idx_t count = 0;
	for (idx_t i = batch_start; i < batch_end; i++) {
		string filepath = bind_data.files[i];
		std::replace(filepath.begin(), filepath.end(), '\\', '/');

		auto sep = filepath.find_last_of('/');
		string filename = (sep == string::npos) ? filepath : filepath.substr(sep + 1);
		string stem = filename.substr(0, filename.size() - 3);

		string relative_path = filepath;
		const string &graph_path = bind_data.graph_path;
		if (filepath.size() > graph_path.size() && filepath.compare(0, graph_path.size(), graph_path) == 0) {
			relative_path = filepath.substr(graph_path.size());
			if (!relative_path.empty() && relative_path[0] == '/') {
				relative_path = relative_path.substr(1);
			}
		}

		string contents = ReadFileContents(fs, bind_data.files[i]);
		auto doc = ParseDocument(contents);
		string title = ResolveTitle(stem, doc, bind_data.title_property, contents);

		filename_data[count] = StringVector::AddString(output.data[0], filename);
		filepath_data[count] = StringVector::AddString(output.data[1], filepath);
		relpath_data[count] = StringVector::AddString(output.data[2], relative_path);
		title_data[count] = StringVector::AddString(output.data[3], title);
		props_data[count] = StringVector::AddString(output.data[4], PagePropertiesJson(doc));
		blocks_data[count] = StringVector::AddString(output.data[5], BlocksToJson(doc.blocks));
		count_data[count] = int64_t(FlattenBlocks(doc.blocks).size());
		output.data[7].SetValue(count, DiagnosticsToValue(doc.diagnostics));
		count++;
	}
	output.SetCardinality(count);
}

static unique_ptr<NodeStatistics> LogseqPagesCardinality(ClientContext &context, const FunctionData *bind_data) {
	auto &data = bind_data->Cast<LogseqPagesScanData>();
	idx_t n = data.files.size();
	return make_uniq<NodeStatistics>(n, n);
}

static void LoadInternal(ExtensionLoader &loader) {
	ExtensionHelper::TryAutoLoadExtension(loader.GetDatabaseInstance(), "json");

	ScalarFunction logseq_parse("logseq_parse", {LogicalType::VARCHAR}, ParseResultType(), LogseqParseFunction);
	loader.RegisterFunction(logseq_parse);

	ScalarFunction logseq_blocks("logseq_blocks", {LogicalType::VARCHAR}, LogicalType::JSON(), LogseqBlocksFunction);
	loader.RegisterFunction(logseq_blocks);

	ScalarFunction logseq_frontmatter("logseq_frontmatter", {LogicalType::VARCHAR}, LogicalType::JSON(),
	                                  LogseqFrontmatterFunction);
	loader.RegisterFunction(logseq_frontmatter);

	ScalarFunction logseq_block_rows("logseq_block_rows", {LogicalType::VARCHAR}, LogicalType::LIST(BlockRowType()),
	                                 LogseqBlockRowsFunction);
	loader.RegisterFunction(logseq_block_rows);

	ScalarFunction logseq_merge_properties("logseq_merge_properties", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                       LogicalType::JSON(), LogseqMergePropertiesFunction);
	logseq_merge_properties.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
	loader.RegisterFunction(logseq_merge_properties);

	ScalarFunctionSet logseq_outline("logseq_outline");
	logseq_outline.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, LogseqOutlineFunction));
	logseq_outline.AddFunction(
	    ScalarFunction({LogicalType::VARCHAR, LogicalType::INTEGER}, LogicalType::VARCHAR, LogseqOutlineDepthFunction));
	loader.RegisterFunction(logseq_outline);

	TableFunction logseq_pages_function("logseq_pages", {LogicalType::VARCHAR}, LogseqPagesFunction, LogseqPagesBind,
	                                    LogseqPagesInitGlobal, LogseqPagesInitLocal);
	logseq_pages_function.named_parameters["title_property"] = LogicalType::VARCHAR;
	logseq_pages_function.cardinality = LogseqPagesCardinality;
	loader.RegisterFunction(logseq_pages_function);
}

void LogseqExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string LogseqExtension::Name() {
	return "logseq";
}

std::string LogseqExtension::Version() const {
#ifdef EXT_VERSION_LOGSEQ
	return EXT_VERSION_LOGSEQ;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(logseq, loader) {
	duckdb::LoadInternal(loader);
}
}
