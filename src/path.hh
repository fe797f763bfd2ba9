#ifndef PATH_HH
# define PATH_HH

# include <string>
# include <vector>

// Lexical cleanup: collapses "//", drops "." components and folds ".."
// where a parent is known. Never touches the filesystem.
std::string path_clean(const std::string& path);

// dir/name, unless name is already absolute
std::string path_join(const std::string& dir, const std::string& name);

bool path_is_absolute(const std::string& path);

// expr matches path when both are equal, or when expr is a suffix of path
// starting right after a '/'
bool partial_path_match(const std::string& expr, const std::string& path);

// removes adjacent duplicates of a sorted vector in place
void uniq(std::vector<std::string>& sorted);

#endif /* !PATH_HH */
