#include "logseq_title.hpp"

#include <cmark-gfm.h>

namespace duckdb {

string FirstHeadingText(const char *body, size_t body_size) {
	cmark_node *doc = cmark_parse_document(body, body_size, CMARK_OPT_DEFAULT);
	if (!doc) {
		return string();
	}

	cmark_iter *iter = cmark_iter_new(doc);
	cmark_event_type ev;
	bool in_heading = false;
	string heading_text;

	while ((ev = cmark_iter_next(iter)) != CMARK_EVENT_DONE) {
		cmark_node *node = cmark_iter_get_node(iter);
		cmark_node_type type = cmark_node_get_type(node);

		if (type == CMARK_NODE_HEADING) {
			if (ev == CMARK_EVENT_ENTER) {
				in_heading = cmark_node_get_heading_level(node) == 1;
				heading_text.clear();
			} else if (in_heading) {
				if (!heading_text.empty()) {
					break;
				}
				in_heading = false;
			}
		} else if (in_heading && ev == CMARK_EVENT_ENTER &&
		           (type == CMARK_NODE_TEXT || type == CMARK_NODE_CODE)) {
			const char *lit = cmark_node_get_literal(node);
			if (lit) {
				heading_text += lit;
			}
		}
	}
	cmark_iter_free(iter);
	cmark_node_free(doc);

	return heading_text;
}

} // namespace duckdb
