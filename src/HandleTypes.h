#pragma once

#include <memory>
#include <tree_sitter/api.h>

template <auto Fn>
struct Deleter {
    template <typename T>
    void operator()(T* ptr) const {
        if (ptr) Fn(ptr);
    }
};

template <typename T, auto Fn>
using Handle = std::unique_ptr<T, Deleter<Fn>>;

using TSParserPtr = Handle<TSParser, ts_parser_delete>;
using TSTreePtr = Handle<TSTree, ts_tree_delete>;
using TSQueryPtr = Handle<TSQuery, ts_query_delete>;
using TSQueryCursorPtr = Handle<TSQueryCursor, ts_query_cursor_delete>;
