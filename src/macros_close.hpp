#undef required
#undef interface
#undef unreachable
#undef assert
