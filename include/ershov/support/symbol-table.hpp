/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ershov
{
	/**
	 * @brief Interns leaf spellings (variable names and numeric literals).
	 *
	 * Two leaves are the same DAG node only if their kind and their symbol id
	 * match, so the table is the identity source for leaves. The table owns its
	 * strings and is safe to copy along with the DAG that holds it.
	 */
	class SymbolTable
	{
	public:
		using SymbolId = std::uint32_t;
		static constexpr SymbolId INVALID_SYMBOL = std::numeric_limits<SymbolId>::max();

		SymbolTable();

		/**
		 * @param spelling Spelling to intern.
		 * @return Symbol id; the same spelling always yields the same id.
		 */
		SymbolId intern(std::string_view spelling);

		/**
		 * @param id Symbol id to retrieve.
		 * @return Interned spelling.
		 * @throws std::out_of_range if `id` was never handed out
		 */
		[[nodiscard]] std::string_view get(SymbolId id) const;

		/**
		 * @param spelling Spelling to look up without interning it
		 * @return Symbol id if present
		 */
		[[nodiscard]] std::optional<SymbolId> find(std::string_view spelling) const;

		[[nodiscard]] bool contains(std::string_view spelling) const;

		/**
		 * @return Number of interned spellings, the empty spelling included
		 */
		[[nodiscard]] std::size_t size() const;

		void clear();

	private:
		/* heterogeneous lookup so callers can look up with a string_view */
		struct SpellingHash
		{
			using is_transparent = void;
			std::size_t operator()(const std::string_view sv) const
			{
				return std::hash<std::string_view>{}(sv);
			}
		};

		struct SpellingEqual
		{
			using is_transparent = void;
			bool operator()(const std::string_view lhs, const std::string_view rhs) const
			{
				return lhs == rhs;
			}
		};

		std::unordered_map<std::string, SymbolId, SpellingHash, SpellingEqual> ids;
		std::vector<std::string> spellings;
	};
}
