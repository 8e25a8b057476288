#include "../../confl-lang.hh"
#include "../internal.hh"
#include "../utils.hh"

namespace confl
{

    using namespace trieste;

    PassDef parse_cleanup()
    {
        return {
            "parse_cleanup",
            parse::wf_parse_cleanup,
            (dir::topdown),
            {
                In(Top) * (T(File)[File] << (T(Group) * T(Group) * T(Group)++)) >>
                    [](Match &_) -> Node
                    {
                        return err(_(File), "a file holds a single expression");
                    },

                In(Top) * (T(File)[File] << End) >>
                    [](Match &_) -> Node
                    {
                        return err(_(File), "empty file");
                    },

                In(File) * T(Group)[Group] >>
                    [](Match &_) -> Node
                    {
                        return Expr << *_[Group];
                    },
            }};
    }

}
